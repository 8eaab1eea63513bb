#include "BrickField.hpp"

#include <algorithm>
#include <cstddef>

constexpr int BrickField::BRICK_WIDTH;
constexpr int BrickField::BRICK_GAP;
constexpr int BrickField::FIRST_ROW;

void BrickField::layout(int fieldInteriorWidth) {
    bricks_.clear();

    columns_ = (fieldInteriorWidth + BRICK_GAP) / (BRICK_WIDTH + BRICK_GAP);
    columns_ = std::max(0, std::min(columns_, maxColumns_));
    if (columns_ == 0 || rows_ <= 0) return;

    // center inside the walls (interior starts at column 1)
    const int waveWidth = columns_ * BRICK_WIDTH + (columns_ - 1) * BRICK_GAP;
    const int left = 1 + (fieldInteriorWidth - waveWidth) / 2;

    bricks_.reserve(static_cast<std::size_t>(rows_ * columns_));
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < columns_; ++c) {
            Brick b;
            b.x = left + c * (BRICK_WIDTH + BRICK_GAP);
            b.y = FIRST_ROW + r;
            b.w = BRICK_WIDTH;
            b.alive = true;
            bricks_.push_back(b);
        }
    }
}

bool BrickField::testHit(int col, int row) {
    if (row < firstRow() || row > lastRow()) return false;

    for (Brick& b : bricks_) {
        if (!b.alive || b.y != row) continue;
        if (col >= b.x && col < b.x + b.w) {
            b.alive = false;
            return true;
        }
    }
    return false;
}

int BrickField::aliveCount() const {
    return static_cast<int>(std::count_if(bricks_.begin(), bricks_.end(),
                                          [](const Brick& b) { return b.alive; }));
}

void BrickField::regenerate() {
    for (Brick& b : bricks_) b.alive = true;
}
