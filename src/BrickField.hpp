#pragma once

#include <vector>

struct Brick {
    int  x = 0;
    int  y = 0;
    int  w = 0;
    bool alive = true;
};

// One wave of bricks. Geometry is a pure function of the field interior width,
// so regenerating always reproduces the same layout.
class BrickField {
public:
    static constexpr int BRICK_WIDTH = 4;
    static constexpr int BRICK_GAP   = 1;
    static constexpr int FIRST_ROW   = 2;

    BrickField() = default;
    BrickField(int rows, int maxColumns) : rows_(rows), maxColumns_(maxColumns) {}

    // Computes columns and horizontal centering for the given interior width
    // and brings every brick back to life.
    void layout(int fieldInteriorWidth);

    // Kills the first alive brick covering (col,row). Returns true on a hit.
    bool testHit(int col, int row);

    bool remaining() const { return aliveCount() > 0; }
    int  aliveCount() const;

    // Same layout, full liveness.
    void regenerate();

    const std::vector<Brick>& bricks() const { return bricks_; }
    int columns() const { return columns_; }
    int rows() const { return rows_; }
    int firstRow() const { return FIRST_ROW; }
    int lastRow() const { return FIRST_ROW + rows_ - 1; }

private:
    int rows_       = 4;
    int maxColumns_ = 12;
    int columns_    = 0;
    std::vector<Brick> bricks_;
};
