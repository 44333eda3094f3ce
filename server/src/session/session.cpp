#include "receive_session.hpp"
#include "receiver_server.hpp"

#include "lanbeam/helpers.hpp"
#include "lanbeam/log.hpp"
#include "lanbeam/wire_protocol.hpp"

#include <filesystem>
#include <thread>

namespace lanbeam {

ReceiveSession::ReceiveSession(const int &fd, const std::string &peer, const std::string &session_id, ReceiverServer &server)
    : client_fd(fd), peer(peer), session_id(session_id), server(server) {}

HistoryRecord ReceiveSession::run() {
    namespace fs = std::filesystem;
    const EngineConfig &config = this->server.getConfig();
    auto started = std::chrono::steady_clock::now();

    HistoryRecord record;
    record.time = now_history_time();
    record.direction = Direction::Receive;
    record.peer = this->peer;
    record.device = config.device_name;
    size_t verified = 0;

    try {
        set_socket_timeout(this->client_fd, config.io_timeout);
        this->manifest = read_manifest(this->client_fd, config.max_metadata_bytes);
        record.file_count = this->manifest.fileCount();
        record.total_bytes = this->manifest.totalBytes();
        record.verified_total = this->manifest.fileCount();
        log_info("Receiving " + std::to_string(record.file_count) + " file(s), " + std::to_string(record.total_bytes) + " bytes from " + this->peer);

        this->buffer.resize(config.chunk_size);
        ProgressMeter meter(record.total_bytes, config.speed_window, config.progress_interval);
        bool cancelled = false;

        for (const auto &file : this->manifest.files) {
            this->checkpoint();
            this->current_file = sanitize_file_name(file.relative_name);
            std::string target = (fs::path(config.download_dir) / this->current_file).string();

            // another session receiving the same name counts as a conflict too
            TargetClaim claim(this->server, target);
            bool in_flight = !claim.tryAcquire();
            if (in_flight || fs::exists(target)) {
                if (in_flight) {
                    log_info(this->current_file + " is being received by another transfer");
                }
                OverwriteDecision decision = this->resolveConflict(this->current_file);
                if (decision == OverwriteDecision::CancelAll) {
                    log_info("Transfer from " + this->peer + " cancelled at " + this->current_file);
                    cancelled = true;
                    break;
                }
                if (decision == OverwriteDecision::Overwrite && !claim.acquire(config.io_timeout)) {
                    this->checkpoint();
                    log_warning(this->current_file + " is still busy, skipping");
                    decision = OverwriteDecision::Skip;
                }
                if (decision == OverwriteDecision::Skip) {
                    log_info("Skipping existing file " + this->current_file);
                    this->drain(file.size_bytes, meter);
                    this->files_done++;
                    continue;
                }
            }

            this->reportDuplicate(file, target);
            if (this->receiveFile(file, target, meter)) {
                verified++;
                this->server.getDuplicates().recordTransfer(target, file.sha256_hex, this->peer);
            }
            this->files_done++;
        }

        this->report(meter, true);
        record.status = cancelled ? TransferStatus::Cancelled : TransferStatus::Success;
    } catch (const std::exception &e) {
        const std::string code = error_code(e);
        if (code == "interrupted" || this->server.isStopping()) {
            record.status = TransferStatus::Interrupted;
        } else if (code == "cancelled" || this->server.getControl().isCancelled()) {
            record.status = TransferStatus::Cancelled;
        } else {
            record.status = TransferStatus::Failed;
        }
        record.error = e.what();
        log_error("Receive from " + this->peer + " ended (" + to_string(record.status) + "): " + e.what());
    }

    record.verified = verified;
    record.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    log_info("Receive from " + this->peer + ": " + to_string(record.status) + ", verified " + record.verifiedText());
    this->server.recordHistory(record);
    return record;
}

// throws at chunk boundaries when the transfer must stop, blocks while paused
void ReceiveSession::checkpoint() const {
    TransferControl &control = this->server.getControl();
    const auto poll = this->server.getConfig().pause_poll_interval;
    while (control.isPaused() && !control.isCancelled() && !this->server.isStopping()) {
        std::this_thread::sleep_for(poll);
    }
    if (this->server.isStopping()) {
        throw std::runtime_error("interrupted: Receiver stopped during transfer");
    }
    if (control.isCancelled()) {
        throw std::runtime_error("cancelled: Transfer cancelled");
    }
}

void ReceiveSession::report(ProgressMeter &meter, const bool &force) {
    const TransferObserver &observer = this->server.getObserver();
    if (!observer.on_progress) {
        return;
    }
    auto now = ProgressMeter::Clock::now();
    if (!meter.due(now) && !force) {
        return;
    }
    ProgressInfo info;
    info.job_id = this->session_id;
    info.bytes_done = meter.bytesDone();
    info.total_bytes = meter.totalBytes();
    info.speed_bps = meter.speed(now);
    info.eta_seconds = meter.eta(now);
    info.current_file = this->current_file;
    info.files_done = this->files_done;
    info.files_total = this->manifest.fileCount();
    observer.on_progress(info);
}

} // namespace lanbeam
