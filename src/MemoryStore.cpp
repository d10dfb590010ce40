#include "MemoryStore.h"
#include "ArtifactJson.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"

#include <filesystem>
#include <iostream>

MemoryStore::MemoryStore(std::string path) : path_(std::move(path)) {
    load();
}

void MemoryStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return;

    try {
        const Json::Value root = ArtifactJson::readJsonFile(path_);
        if (!root.isObject()) throw Augur::DatasetException("memory root is not an object");

        const Json::Value& datasets = root["datasets"];
        const Json::Value& notes = root["notes"];
        if (!datasets.isNull() && !datasets.isObject()) throw Augur::DatasetException("'datasets' is not an object");
        if (!notes.isNull() && !notes.isArray()) throw Augur::DatasetException("'notes' is not an array");

        std::map<std::string, MemoryRecord> loaded;
        for (const auto& fp : datasets.getMemberNames()) {
            loaded[fp] = ArtifactJson::memoryRecordFromJson(datasets[fp]);
        }
        std::vector<MemoryNote> loadedNotes;
        for (const auto& n : notes) loadedNotes.push_back(ArtifactJson::memoryNoteFromJson(n));

        datasets_ = std::move(loaded);
        notes_ = std::move(loadedNotes);
    } catch (const Augur::AugurException& ex) {
        resetAfterCorruption(ex.what());
    } catch (const Json::Exception& ex) {
        resetAfterCorruption(ex.what());
    }
}

void MemoryStore::resetAfterCorruption(const std::string& reason) {
    datasets_.clear();
    notes_.clear();

    const std::string backup = path_ + ".bak";
    std::error_code ec;
    std::filesystem::copy_file(path_, backup, std::filesystem::copy_options::overwrite_existing, ec);
    std::cerr << "[Augur][Memory] Unreadable memory file '" << path_ << "' (" << reason << ")\n";
    if (ec) {
        notes_.push_back({CommonUtils::nowIsoUtc(), "Memory reset; backup to " + backup + " failed: " + ec.message()});
    } else {
        notes_.push_back({CommonUtils::nowIsoUtc(), "Memory reset; backup at " + backup});
    }
}

std::optional<MemoryRecord> MemoryStore::get(const std::string& fingerprint) const {
    auto it = datasets_.find(fingerprint);
    if (it == datasets_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::upsert(const std::string& fingerprint, const MemoryRecord& record) {
    datasets_[fingerprint] = record;
    save();
}

void MemoryStore::addNote(const std::string& msg) {
    notes_.push_back({CommonUtils::nowIsoUtc(), msg});
    save();
}

void MemoryStore::save() const {
    Json::Value root(Json::objectValue);
    Json::Value datasets(Json::objectValue);
    for (const auto& kv : datasets_) datasets[kv.first] = ArtifactJson::toJson(kv.second);
    Json::Value notes(Json::arrayValue);
    for (const auto& n : notes_) notes.append(ArtifactJson::toJson(n));
    root["datasets"] = datasets;
    root["notes"] = notes;

    const std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) throw Augur::IOException("Cannot create directory for memory file: " + parent.string());
    }
    ArtifactJson::writeJsonFile(path_, root);
}
