#pragma once

#include "transfer_types.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lanbeam {

// persisted "<sha256>_<basename>" -> recent transfers index
class DuplicateStore {
public:
    static constexpr size_t MAX_RECORDS_PER_KEY = 1000;

    explicit DuplicateStore(const std::string &path);

    void recordTransfer(const std::string &path, const std::string &hash, const std::string &peer_address);
    std::pair<bool, std::optional<DuplicateRecord>> isDuplicate(const std::string &path, const std::string &hash, const std::string &peer_address) const;
    std::vector<DuplicateRecord> lookup(const std::string &path, const std::string &hash) const;
    void clear();

    void exportTo(const std::string &path) const;
    size_t keyCount() const;
    size_t recordCount() const;
    const std::string &getPath() const;

    static const std::string key(const std::string &path, const std::string &hash);

private:
    const std::string path;
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::deque<DuplicateRecord>> records;

    void load();
    void save() const;
    void writeTo(const std::string &path) const;
};

} // namespace lanbeam
