#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam {

enum class Direction { Send, Receive };

enum class JobState {
    Queued,
    Connecting,
    SendingMetadata,
    Transferring,
    Verifying,
    Completed,
    Cancelled,
    Failed
};

enum class TransferStatus { Success, Cancelled, Interrupted, Failed };

enum class OverwriteDecision { Overwrite, Skip, CancelAll };

const std::string to_string(const Direction &direction);
const std::string to_string(const JobState &state);
const std::string to_string(const TransferStatus &status);
const std::string to_string(const OverwriteDecision &decision);
bool is_terminal(const JobState &state);

struct Peer {
    std::string address;
    std::string display_name;
    std::chrono::steady_clock::time_point last_seen;
};

struct FileDescriptor {
    std::string relative_name;
    uint64_t size_bytes = 0;
    std::string sha256_hex;

    bool operator==(const FileDescriptor &other) const = default;
};

struct TransferManifest {
    std::vector<FileDescriptor> files;

    size_t fileCount() const { return this->files.size(); }
    uint64_t totalBytes() const;
};

struct DuplicateRecord {
    std::string path;
    std::string sha256_hex;
    std::string peer_address;
    std::string timestamp;
};

struct HistoryRecord {
    std::string time;
    Direction direction = Direction::Send;
    std::string peer;
    size_t file_count = 0;
    uint64_t total_bytes = 0;
    double duration_seconds = 0.0;
    size_t verified = 0;
    size_t verified_total = 0;
    TransferStatus status = TransferStatus::Failed;
    std::string device;
    std::string error;

    const std::string verifiedText() const;
};

struct ProgressInfo {
    std::string job_id;
    uint64_t bytes_done = 0;
    uint64_t total_bytes = 0;
    double speed_bps = 0.0;
    std::optional<double> eta_seconds;
    std::string current_file;
    size_t files_done = 0;
    size_t files_total = 0;
};

struct OverwriteReply {
    OverwriteDecision decision = OverwriteDecision::Skip;
    bool apply_to_all = true;
};

// callbacks into the front-end, every member may be left empty
struct TransferObserver {
    std::function<void(const ProgressInfo&)> on_progress;
    // runs on a detached thread and may outlive the session and the server when it misses
    // overwrite_timeout, so whatever it captures by reference must outlive them too
    std::function<OverwriteReply(const std::string&)> on_overwrite;
    std::function<void(const HistoryRecord&)> on_complete;
    std::function<void(const std::string&, const std::vector<DuplicateRecord>&)> on_duplicate;
    std::function<void(const std::string&, const JobState&)> on_state;
    std::function<void(const std::string&, bool)> on_integrity;
};

} // namespace lanbeam
