#include "HighScoreStore.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

constexpr std::size_t HighScoreStore::MAX_ENTRIES;
constexpr std::size_t HighScoreStore::MAX_NAME;

bool FileScoreStorage::read(std::string& out) {
    std::ifstream f(path_, std::ios::binary);
    if (!f) return false;
    std::stringstream ss;
    ss << f.rdbuf();
    if (f.bad()) return false;
    out = ss.str();
    return true;
}

bool FileScoreStorage::write(const std::string& data) {
    std::ofstream f(path_, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << data;
    f.flush();
    return static_cast<bool>(f);
}

HighScoreStore::HighScoreStore(std::unique_ptr<IScoreStorage> storage)
    : storage_(std::move(storage))
{
}

bool HighScoreStore::isNameChar(char c) {
    const unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == ' ' || c == '-' || c == '_' || c == '.';
}

std::string HighScoreStore::sanitizeName(const std::string& raw) {
    std::string out;
    for (char c : raw) {
        if (out.size() >= MAX_NAME) break;
        if (isNameChar(c)) out.push_back(c);
    }
    return out;
}

std::vector<HighScoreEntry> HighScoreStore::deserialize(const std::string& text) {
    std::vector<HighScoreEntry> result;
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("high scores unreadable ({}), starting empty", e.what());
        return result;
    }
    if (!j.is_array()) {
        spdlog::warn("high scores are not a list, starting empty");
        return result;
    }

    for (const auto& item : j) {
        if (!item.is_object()) continue;
        auto name  = item.find("name");
        auto score = item.find("score");
        if (name == item.end() || score == item.end()) continue;
        if (!name->is_string() || !score->is_number_integer()) continue;

        const long long value = score->get<long long>();
        if (value < 0 || value > 0x7fffffffLL) continue;

        HighScoreEntry e;
        e.name  = sanitizeName(name->get<std::string>());
        e.score = static_cast<int>(value);
        result.push_back(e);
    }

    // a hand-edited file may be unordered
    std::stable_sort(result.begin(), result.end(),
                     [](const HighScoreEntry& a, const HighScoreEntry& b) { return a.score > b.score; });
    if (result.size() > MAX_ENTRIES) result.resize(MAX_ENTRIES);
    return result;
}

std::string HighScoreStore::serialize() const {
    nlohmann::json j = nlohmann::json::array();
    const std::size_t n = std::min(entries_.size(), MAX_ENTRIES);
    for (std::size_t i = 0; i < n; ++i) {
        j.push_back({{"name", entries_[i].name}, {"score", entries_[i].score}});
    }
    return j.dump();
}

void HighScoreStore::load() {
    entries_.clear();
    if (!storage_) return;

    std::string text;
    if (!storage_->read(text)) {
        spdlog::info("no stored high scores, starting empty");
        return;
    }
    entries_ = deserialize(text);
    spdlog::info("loaded {} high scores", entries_.size());
}

int HighScoreStore::record(HighScoreEntry entry) {
    entry.name = sanitizeName(entry.name);
    if (entry.score < 0) entry.score = 0;

    // insert after every entry with an equal or higher score (ties keep insertion order)
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), entry,
                                [](const HighScoreEntry& a, const HighScoreEntry& b) { return a.score > b.score; });
    const int rank = static_cast<int>(pos - entries_.begin());
    entries_.insert(pos, entry);

    if (entries_.size() > MAX_ENTRIES) entries_.resize(MAX_ENTRIES);
    persist();

    if (rank >= static_cast<int>(MAX_ENTRIES)) {
        spdlog::info("score {} for '{}' did not make the table", entry.score, entry.name);
        return -1;
    }
    spdlog::info("recorded '{}' with {} at rank {}", entry.name, entry.score, rank + 1);
    return rank;
}

std::vector<HighScoreEntry> HighScoreStore::topN(std::size_t n) const {
    const std::size_t count = std::min(n, entries_.size());
    return std::vector<HighScoreEntry>(entries_.begin(), entries_.begin() + count);
}

void HighScoreStore::persist() {
    if (!storage_) return;
    if (!storage_->write(serialize())) {
        spdlog::warn("high score write skipped, storage unavailable");
    }
}
