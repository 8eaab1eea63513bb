#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// BACKING STORAGE (one named record)

class IScoreStorage {
public:
    virtual ~IScoreStorage() = default;

    // false when nothing could be read (missing, unreadable)
    virtual bool read(std::string& out) = 0;
    // false when the write was skipped
    virtual bool write(const std::string& data) = 0;
};

class FileScoreStorage final : public IScoreStorage {
    std::string path_;
public:
    explicit FileScoreStorage(std::string path) : path_(std::move(path)) {}

    bool read(std::string& out) override;
    bool write(const std::string& data) override;

    const std::string& path() const { return path_; }
};

// HIGH SCORES

struct HighScoreEntry {
    std::string name;
    int score = 0;
};

class HighScoreStore {
public:
    static constexpr std::size_t MAX_ENTRIES = 100;
    static constexpr std::size_t MAX_NAME    = 12;

    explicit HighScoreStore(std::unique_ptr<IScoreStorage> storage);

    // Replaces the in-memory list with whatever the storage holds.
    // Any failure leaves an empty list.
    void load();

    // Inserts, keeps score-descending order (stable on ties), truncates and persists.
    // Returns the 0-based rank, or -1 if the entry did not make the cut.
    int record(HighScoreEntry entry);

    std::vector<HighScoreEntry> topN(std::size_t n) const;
    const std::vector<HighScoreEntry>& entries() const { return entries_; }

    static bool isNameChar(char c);
    // Drops characters outside the safe set and caps the length.
    static std::string sanitizeName(const std::string& raw);

    std::string serialize() const;
    static std::vector<HighScoreEntry> deserialize(const std::string& text);

private:
    void persist();

    std::unique_ptr<IScoreStorage> storage_;
    std::vector<HighScoreEntry> entries_;
};
