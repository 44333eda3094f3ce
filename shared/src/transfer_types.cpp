#include "lanbeam/transfer_types.hpp"

namespace lanbeam {

const std::string to_string(const Direction &direction) {
    return direction == Direction::Send ? "Send" : "Receive";
}

const std::string to_string(const JobState &state) {
    switch (state) {
        case JobState::Queued: return "Queued";
        case JobState::Connecting: return "Connecting";
        case JobState::SendingMetadata: return "SendingMetadata";
        case JobState::Transferring: return "Transferring";
        case JobState::Verifying: return "Verifying";
        case JobState::Completed: return "Completed";
        case JobState::Cancelled: return "Cancelled";
        case JobState::Failed: return "Failed";
    }
    return "Unknown";
}

const std::string to_string(const TransferStatus &status) {
    switch (status) {
        case TransferStatus::Success: return "Success";
        case TransferStatus::Cancelled: return "Cancelled";
        case TransferStatus::Interrupted: return "Interrupted";
        case TransferStatus::Failed: return "Failed";
    }
    return "Unknown";
}

const std::string to_string(const OverwriteDecision &decision) {
    switch (decision) {
        case OverwriteDecision::Overwrite: return "overwrite";
        case OverwriteDecision::Skip: return "skip";
        case OverwriteDecision::CancelAll: return "cancel-all";
    }
    return "skip";
}

bool is_terminal(const JobState &state) {
    return state == JobState::Completed || state == JobState::Cancelled || state == JobState::Failed;
}

uint64_t TransferManifest::totalBytes() const {
    uint64_t total = 0;
    for (const auto &file : this->files) {
        total += file.size_bytes;
    }
    return total;
}

const std::string HistoryRecord::verifiedText() const {
    return std::to_string(this->verified) + "/" + std::to_string(this->verified_total);
}

} // namespace lanbeam
