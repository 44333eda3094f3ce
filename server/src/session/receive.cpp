#include "receive_session.hpp"
#include "receiver_server.hpp"

#include "lanbeam/hash_stream.hpp"
#include "lanbeam/helpers.hpp"
#include "lanbeam/log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace lanbeam {

// advisory, the file is received anyway
void ReceiveSession::reportDuplicate(const FileDescriptor &file, const std::string &target) const {
    DuplicateStore &duplicates = this->server.getDuplicates();
    if (!duplicates.isDuplicate(target, file.sha256_hex, this->peer).first) {
        return;
    }
    std::vector<DuplicateRecord> records;
    for (const auto &entry : duplicates.lookup(target, file.sha256_hex)) {
        if (entry.peer_address == this->peer && entry.sha256_hex == file.sha256_hex) {
            records.push_back(entry);
        }
    }
    log_warning("Duplicate detected: " + this->current_file + " was already received from " + this->peer +
                (records.empty() ? "" : " on " + records.back().timestamp));
    const TransferObserver &observer = this->server.getObserver();
    if (observer.on_duplicate) {
        observer.on_duplicate(this->current_file, records);
    }
}

bool ReceiveSession::receiveFile(const FileDescriptor &file, const std::string &target, ProgressMeter &meter) {
    // private .part per session, renamed once every byte is on disk
    const std::string part_path = target + "." + this->session_id + ".part";
    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("file_open_failed: Cannot write " + part_path);
    }

    HashStream hash;
    uint64_t remaining = file.size_bytes;
    try {
        while (remaining > 0) {
            this->checkpoint();
            size_t got = this->recvChunk(remaining);
            out.write(this->buffer.data(), static_cast<std::streamsize>(got));
            if (!out) {
                throw std::runtime_error("file_write_failed: Write to " + part_path + " failed");
            }
            hash.update(this->buffer.data(), got);
            remaining -= got;
            meter.add(got);
            this->report(meter, false);
        }
        out.close();
        if (out.fail()) {
            throw std::runtime_error("file_write_failed: Closing " + part_path + " failed");
        }
    } catch (const std::exception &) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(part_path, ec);
        throw;
    }

    std::error_code ec;
    std::filesystem::rename(part_path, target, ec);
    if (ec) {
        throw std::runtime_error("file_write_failed: Cannot move " + part_path + " into place: " + ec.message());
    }

    const std::string actual = hash.digest();
    bool ok = digests_equal(actual, file.sha256_hex);
    if (ok) {
        log_info("Verified " + this->current_file + " (" + std::to_string(file.size_bytes) + " bytes)");
    } else {
        log_warning("Integrity check failed for " + this->current_file + ": expected " + file.sha256_hex + ", got " + actual);
    }

    const TransferObserver &observer = this->server.getObserver();
    if (observer.on_integrity) {
        observer.on_integrity(this->current_file, ok);
    }
    return ok;
}

// consume a skipped file without touching the disk
void ReceiveSession::drain(const uint64_t &size, ProgressMeter &meter) {
    uint64_t remaining = size;
    while (remaining > 0) {
        this->checkpoint();
        size_t got = this->recvChunk(remaining);
        remaining -= got;
        meter.add(got);
        this->report(meter, false);
    }
}

size_t ReceiveSession::recvChunk(const uint64_t &remaining) {
    size_t to_recv = static_cast<size_t>(std::min<uint64_t>(remaining, this->buffer.size()));
    recv_exact(this->client_fd, this->buffer.data(), to_recv);
    return to_recv;
}

} // namespace lanbeam
