#pragma once

#include "transfer_types.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace lanbeam {

constexpr size_t MAX_HISTORY_RECORDS = 2000;

// completed-transfer records kept in a JSON array file
class HistoryLog {
public:
    explicit HistoryLog(const std::string &path);

    void append(const HistoryRecord &record);
    std::vector<HistoryRecord> getRecords() const;
    void clear();
    void exportTo(const std::string &path) const;

private:
    const std::string path;
    mutable std::mutex mutex;
    std::vector<HistoryRecord> records;

    void load();
    void save() const;
    void writeTo(const std::string &path) const;
};

} // namespace lanbeam
