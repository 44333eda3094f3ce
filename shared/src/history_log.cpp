#include "lanbeam/history_log.hpp"
#include "lanbeam/log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace lanbeam {

namespace {

nlohmann::json to_json(const HistoryRecord &record) {
    nlohmann::json doc = {
        {"time", record.time},
        {"direction", to_string(record.direction)},
        {"peer", record.peer},
        {"files", record.file_count},
        {"size", record.total_bytes},
        {"duration", record.duration_seconds},
        {"verified", record.verifiedText()},
        {"status", to_string(record.status)},
        {"device", record.device}
    };
    if (!record.error.empty()) {
        doc["error"] = record.error;
    }
    return doc;
}

TransferStatus status_from_string(const std::string &status) {
    if (status == "Success") return TransferStatus::Success;
    if (status == "Cancelled") return TransferStatus::Cancelled;
    if (status == "Interrupted") return TransferStatus::Interrupted;
    return TransferStatus::Failed;
}

HistoryRecord from_json(const nlohmann::json &doc) {
    HistoryRecord record;
    record.time = doc.value("time", "");
    record.direction = doc.value("direction", "Send") == "Receive" ? Direction::Receive : Direction::Send;
    record.peer = doc.value("peer", "");
    record.file_count = doc.value("files", static_cast<size_t>(0));
    record.total_bytes = doc.value("size", static_cast<uint64_t>(0));
    record.duration_seconds = doc.value("duration", 0.0);
    record.status = status_from_string(doc.value("status", "Failed"));
    record.device = doc.value("device", "");
    record.error = doc.value("error", "");

    // "verified" is stored as "<n>/<total>"
    std::string verified = doc.value("verified", "0/0");
    size_t slash = verified.find('/');
    if (slash != std::string::npos) {
        try {
            record.verified = std::stoull(verified.substr(0, slash));
            record.verified_total = std::stoull(verified.substr(slash + 1));
        } catch (const std::exception &) {
            record.verified = 0;
            record.verified_total = 0;
        }
    }
    return record;
}

}

HistoryLog::HistoryLog(const std::string &path) : path(path) {
    this->load();
}

void HistoryLog::append(const HistoryRecord &record) {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->records.push_back(record);
    if (this->records.size() > MAX_HISTORY_RECORDS) {
        this->records.erase(this->records.begin(), this->records.end() - MAX_HISTORY_RECORDS);
    }
    this->save();
}

std::vector<HistoryRecord> HistoryLog::getRecords() const {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->records;
}

void HistoryLog::clear() {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->records.clear();
    this->save();
}

void HistoryLog::exportTo(const std::string &path) const {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->writeTo(path);
}

void HistoryLog::load() {
    if (this->path.empty() || !std::filesystem::exists(this->path)) {
        return;
    }
    std::ifstream file(this->path);
    if (!file.is_open()) {
        log_warning("Could not open history file " + this->path);
        return;
    }
    nlohmann::json doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        log_warning("History file " + this->path + " is corrupt, starting empty");
        return;
    }
    try {
        for (const auto &entry : doc) {
            if (entry.is_object()) {
                this->records.push_back(from_json(entry));
            }
        }
    } catch (const nlohmann::json::exception &e) {
        log_warning("History file " + this->path + " has malformed records (" + e.what() + "), starting empty");
        this->records.clear();
    }
}

void HistoryLog::save() const {
    if (this->path.empty()) {
        return;
    }
    try {
        this->writeTo(this->path);
    } catch (const std::exception &e) {
        log_warning(std::string("Failed to persist transfer history: ") + e.what());
    }
}

void HistoryLog::writeTo(const std::string &path) const {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto &record : this->records) {
        doc.push_back(to_json(record));
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("file_open_failed: Failed to open history file for writing (path: " + path + ")");
    }
    file << doc.dump(4);
}

} // namespace lanbeam
