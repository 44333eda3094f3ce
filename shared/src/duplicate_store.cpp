#include "lanbeam/duplicate_store.hpp"
#include "lanbeam/helpers.hpp"
#include "lanbeam/log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace lanbeam {

DuplicateStore::DuplicateStore(const std::string &path) : path(path) {
    this->load();
}

const std::string DuplicateStore::key(const std::string &path, const std::string &hash) {
    return hash + "_" + base_name(path);
}

void DuplicateStore::recordTransfer(const std::string &path, const std::string &hash, const std::string &peer_address) {
    std::lock_guard<std::mutex> lock(this->mutex);

    DuplicateRecord record;
    record.path = path;
    record.sha256_hex = hash;
    record.peer_address = peer_address;
    record.timestamp = now_iso8601();

    // keep only the most recent entries per hash+name
    auto &entries = this->records[key(path, hash)];
    entries.push_back(std::move(record));
    while (entries.size() > MAX_RECORDS_PER_KEY) {
        entries.pop_front();
    }

    this->save();
}

std::pair<bool, std::optional<DuplicateRecord>> DuplicateStore::isDuplicate(const std::string &path, const std::string &hash, const std::string &peer_address) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto it = this->records.find(key(path, hash));
    if (it == this->records.end()) {
        return {false, std::nullopt};
    }
    for (const auto &entry : it->second) {
        if (entry.sha256_hex == hash && entry.peer_address == peer_address) {
            return {true, entry};
        }
    }
    return {false, std::nullopt};
}

std::vector<DuplicateRecord> DuplicateStore::lookup(const std::string &path, const std::string &hash) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto it = this->records.find(key(path, hash));
    if (it == this->records.end()) {
        return {};
    }
    return std::vector<DuplicateRecord>(it->second.begin(), it->second.end());
}

void DuplicateStore::clear() {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->records.clear();
    this->save();
}

void DuplicateStore::exportTo(const std::string &path) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->writeTo(path);
}

size_t DuplicateStore::keyCount() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->records.size();
}

size_t DuplicateStore::recordCount() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    size_t n = 0;
    for (const auto &entry : this->records) {
        n += entry.second.size();
    }
    return n;
}

const std::string &DuplicateStore::getPath() const {
    return this->path;
}

void DuplicateStore::load() {
    if (this->path.empty() || !std::filesystem::exists(this->path)) {
        return;
    }

    // duplicate tracking is advisory -> unreadable database means empty store
    std::ifstream file(this->path);
    if (!file.is_open()) {
        log_warning("Could not open duplicate database " + this->path + ", starting empty");
        return;
    }
    nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        log_warning("Duplicate database " + this->path + " is corrupt, starting empty");
        return;
    }

    try {
        for (const auto &[k, entries] : doc.items()) {
            if (!entries.is_array()) {
                continue;
            }
            auto &list = this->records[k];
            for (const auto &entry : entries) {
                if (!entry.is_object()) {
                    continue;
                }
                DuplicateRecord record;
                record.path = entry.value("path", "");
                record.sha256_hex = entry.value("hash", "");
                record.peer_address = entry.value("peer", "");
                record.timestamp = entry.value("timestamp", "");
                list.push_back(std::move(record));
            }
            while (list.size() > MAX_RECORDS_PER_KEY) {
                list.pop_front();
            }
        }
    } catch (const nlohmann::json::exception &e) {
        log_warning("Duplicate database " + this->path + " has malformed entries (" + e.what() + "), starting empty");
        this->records.clear();
    }
}

void DuplicateStore::save() const {
    if (this->path.empty()) {
        return;
    }
    try {
        this->writeTo(this->path);
    } catch (const std::exception &e) {
        log_warning(std::string("Failed to persist duplicate database: ") + e.what());
    }
}

void DuplicateStore::writeTo(const std::string &path) const {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto &[k, entries] : this->records) {
        nlohmann::json list = nlohmann::json::array();
        for (const auto &entry : entries) {
            list.push_back({
                {"path", entry.path},
                {"hash", entry.sha256_hex},
                {"peer", entry.peer_address},
                {"timestamp", entry.timestamp}
            });
        }
        doc[k] = std::move(list);
    }

    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("file_open_failed: Could not open duplicate database for writing (path: " + path + ")");
    }
    file << doc.dump(4);
}

} // namespace lanbeam
