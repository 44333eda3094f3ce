#pragma once

#include "lanbeam/progress_meter.hpp"
#include "lanbeam/transfer_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lanbeam {

class ReceiverServer;

// one inbound connection: manifest, then every file in order
class ReceiveSession {
public:
    ReceiveSession(const int &fd, const std::string &peer, const std::string &session_id, ReceiverServer &server);

    // never throws, produces exactly one history record
    HistoryRecord run();

private:
    const int client_fd;
    const std::string peer;
    const std::string session_id;
    ReceiverServer &server;

    TransferManifest manifest;
    std::vector<char> buffer;
    std::optional<OverwriteDecision> sticky_decision;
    size_t files_done = 0;
    std::string current_file;

    // overwrite handling
    OverwriteDecision resolveConflict(const std::string &file_name);
    OverwriteReply askOverwrite(const std::string &file_name) const;

    // streaming
    void reportDuplicate(const FileDescriptor &file, const std::string &target) const;
    bool receiveFile(const FileDescriptor &file, const std::string &target, ProgressMeter &meter);
    void drain(const uint64_t &size, ProgressMeter &meter);
    size_t recvChunk(const uint64_t &remaining);
    void checkpoint() const;
    void report(ProgressMeter &meter, const bool &force);
};

} // namespace lanbeam
