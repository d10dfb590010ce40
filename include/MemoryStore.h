#pragma once
#include "ClassificationMetrics.h"
#include "DatasetProfiler.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct MemoryRecord {
    std::string lastSeen;
    std::string target;
    DatasetShape shape;
    std::string bestModel;
    ModelMetrics bestMetrics;

    bool operator==(const MemoryRecord& other) const {
        return lastSeen == other.lastSeen && target == other.target && shape == other.shape &&
               bestModel == other.bestModel && bestMetrics == other.bestMetrics;
    }
    bool operator!=(const MemoryRecord& other) const { return !(*this == other); }
};

struct MemoryNote {
    std::string ts;
    std::string msg;
};

/**
 * Fingerprint-keyed store of past run outcomes, persisted as one JSON file.
 * Every mutation is written through immediately. Single writer only: two processes
 * sharing a file will lose each other's updates.
 */
class MemoryStore {
public:
    /**
     * @brief Loads the store; a missing file starts empty.
     * @post A corrupt file is copied to <path>.bak and the store resets with a note. Never throws for that case.
     */
    explicit MemoryStore(std::string path);

    std::optional<MemoryRecord> get(const std::string& fingerprint) const;

    /**
     * @throws Augur::IOException when the file cannot be written.
     */
    void upsert(const std::string& fingerprint, const MemoryRecord& record);
    void addNote(const std::string& msg);
    void save() const;

    const std::vector<MemoryNote>& notes() const noexcept { return notes_; }
    size_t size() const noexcept { return datasets_.size(); }
    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    std::map<std::string, MemoryRecord> datasets_;
    std::vector<MemoryNote> notes_;

    void load();
    void resetAfterCorruption(const std::string& reason);
};
