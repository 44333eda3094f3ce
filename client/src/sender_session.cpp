#include "sender_session.hpp"

#include "lanbeam/hash_stream.hpp"
#include "lanbeam/helpers.hpp"
#include "lanbeam/log.hpp"
#include "lanbeam/wire_protocol.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace lanbeam {

std::vector<std::string> collect_files(const std::vector<std::string> &paths) {
    namespace fs = std::filesystem;
    std::vector<std::string> files;
    for (const auto &path : paths) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            std::vector<std::string> found;
            for (const auto &entry : fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec)) {
                if (entry.is_regular_file()) {
                    found.push_back(entry.path().string());
                }
            }
            std::sort(found.begin(), found.end());
            files.insert(files.end(), found.begin(), found.end());
        } else if (fs::is_regular_file(path, ec)) {
            files.push_back(path);
        } else {
            throw std::runtime_error("file_open_failed: No such file: " + path);
        }
    }
    return files;
}

std::vector<SourceFile> describe_files(const std::vector<std::string> &paths) {
    std::vector<SourceFile> sources;
    for (const auto &path : collect_files(paths)) {
        SourceFile source;
        source.path = path;
        source.descriptor.relative_name = base_name(path);
        source.descriptor.size_bytes = std::filesystem::file_size(path);
        source.descriptor.sha256_hex = sha256_file(path);
        sources.push_back(source);
    }
    if (sources.empty()) {
        throw std::runtime_error("no_files: Nothing to send");
    }
    return sources;
}

std::vector<DuplicateRecord> prior_sends(const DuplicateStore &store, const SourceFile &source, const std::string &peer_address) {
    std::vector<DuplicateRecord> records;
    const FileDescriptor &file = source.descriptor;
    if (!store.isDuplicate(source.path, file.sha256_hex, peer_address).first) {
        return records;
    }
    for (const auto &entry : store.lookup(source.path, file.sha256_hex)) {
        if (entry.peer_address == peer_address && entry.sha256_hex == file.sha256_hex) {
            records.push_back(entry);
        }
    }
    return records;
}

SenderSession::SenderSession(const std::string &job_id,
                             const std::string &peer_address,
                             const std::vector<std::string> &paths,
                             const EngineConfig &config,
                             DuplicateStore &duplicates,
                             TransferControl &control,
                             const TransferObserver &observer)
    : job_id(job_id), peer_address(peer_address), paths(paths), config(config),
      duplicates(duplicates), control(control), observer(observer) {}

HistoryRecord SenderSession::run() {
    auto started = std::chrono::steady_clock::now();
    HistoryRecord record = this->baseRecord();
    size_t verified = 0;
    int fd = -1;

    try {
        if (this->control.isCancelled()) {
            throw std::runtime_error("cancelled: Transfer cancelled before start");
        }
        this->setState(JobState::Connecting);

        this->sources = describe_files(this->paths);
        TransferManifest manifest;
        for (const auto &source : this->sources) {
            manifest.files.push_back(source.descriptor);
        }
        this->file_count = manifest.fileCount();
        this->total_bytes = manifest.totalBytes();
        record.file_count = manifest.fileCount();
        record.total_bytes = manifest.totalBytes();
        record.verified_total = manifest.fileCount();

        this->reportDuplicates();

        fd = this->openConnection();
        set_socket_timeout(fd, this->config.io_timeout);

        this->setState(JobState::SendingMetadata);
        write_manifest(fd, manifest);

        this->setState(JobState::Transferring);
        std::vector<char> buffer(this->config.chunk_size);
        ProgressMeter meter(manifest.totalBytes(), this->config.speed_window, this->config.progress_interval);
        for (const auto &source : this->sources) {
            this->current_file = source.descriptor.relative_name;
            this->streamFile(fd, source, buffer, meter);
            verified++;
            this->files_done++;
            this->duplicates.recordTransfer(source.path, source.descriptor.sha256_hex, this->peer_address);
        }
        this->report(meter, true);

        this->setState(JobState::Verifying);
        ::close(fd);
        fd = -1;

        record.status = TransferStatus::Success;
        this->setState(JobState::Completed);
    } catch (const std::exception &e) {
        if (fd >= 0) {
            ::close(fd);
        }
        if (error_code(e) == "cancelled") {
            record.status = TransferStatus::Cancelled;
            this->setState(JobState::Cancelled);
            log_info("Job " + this->job_id + " cancelled");
        } else {
            record.status = TransferStatus::Failed;
            this->setState(JobState::Failed);
            log_error("Job " + this->job_id + " to " + this->peer_address + " failed: " + e.what());
        }
        record.error = e.what();
    }

    record.verified = verified;
    record.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    return record;
}

HistoryRecord SenderSession::abandon() {
    HistoryRecord record = this->baseRecord();
    record.status = TransferStatus::Cancelled;
    record.error = "cancelled: Cancelled while queued";
    this->setState(JobState::Cancelled);
    return record;
}

const std::string &SenderSession::getId() const {
    return this->job_id;
}

const std::string &SenderSession::getPeer() const {
    return this->peer_address;
}

JobState SenderSession::getState() const {
    return this->state;
}

uint64_t SenderSession::bytesSent() const {
    return this->bytes_sent;
}

uint64_t SenderSession::totalBytes() const {
    return this->total_bytes;
}

size_t SenderSession::fileCount() const {
    return this->file_count;
}

void SenderSession::setState(const JobState &new_state) {
    this->state = new_state;
    if (this->observer.on_state) {
        this->observer.on_state(this->job_id, new_state);
    }
}

// advisory only, the file is sent anyway
void SenderSession::reportDuplicates() const {
    for (const auto &source : this->sources) {
        std::vector<DuplicateRecord> records = prior_sends(this->duplicates, source, this->peer_address);
        if (records.empty()) {
            continue;
        }
        log_warning(source.descriptor.relative_name + " was already sent to " + this->peer_address + " on " + records.back().timestamp);
        if (this->observer.on_duplicate) {
            this->observer.on_duplicate(source.descriptor.relative_name, records);
        }
    }
}

int SenderSession::openConnection() const {
    HostPort target{this->peer_address, this->config.transfer_port};
    if (!parse_host_port(this->peer_address, target)) {
        throw std::runtime_error("invalid_address: Malformed peer address " + this->peer_address);
    }
    log_info("Job " + this->job_id + ": connecting to " + target.host + ":" + std::to_string(target.port));
    return connect_with_timeout(target, this->config.connect_timeout);
}

void SenderSession::streamFile(const int &fd, const SourceFile &source, std::vector<char> &buffer, ProgressMeter &meter) {
    std::ifstream in(source.path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("file_open_failed: Cannot open " + source.path);
    }

    uint64_t remaining = source.descriptor.size_bytes;
    while (remaining > 0) {
        if (!this->control.waitWhilePaused(this->config.pause_poll_interval)) {
            throw std::runtime_error("cancelled: Transfer cancelled");
        }
        size_t to_read = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        in.read(buffer.data(), static_cast<std::streamsize>(to_read));
        size_t got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            throw std::runtime_error("file_read_failed: " + source.path + " is shorter than its declared " +
                                     std::to_string(source.descriptor.size_bytes) + " bytes");
        }
        send_all(fd, buffer.data(), got);
        remaining -= got;
        this->bytes_sent += got;
        meter.add(got);
        this->report(meter, false);
    }
}

void SenderSession::report(ProgressMeter &meter, const bool &force) {
    if (!this->observer.on_progress) {
        return;
    }
    auto now = ProgressMeter::Clock::now();
    if (!meter.due(now) && !force) {
        return;
    }
    ProgressInfo info;
    info.job_id = this->job_id;
    info.bytes_done = meter.bytesDone();
    info.total_bytes = meter.totalBytes();
    info.speed_bps = meter.speed(now);
    info.eta_seconds = meter.eta(now);
    info.current_file = this->current_file;
    info.files_done = this->files_done;
    info.files_total = this->file_count;
    this->observer.on_progress(info);
}

HistoryRecord SenderSession::baseRecord() const {
    HistoryRecord record;
    record.time = now_history_time();
    record.direction = Direction::Send;
    record.peer = this->peer_address;
    record.device = this->config.device_name;
    record.file_count = this->file_count;
    record.total_bytes = this->total_bytes;
    record.verified_total = this->file_count;
    return record;
}

} // namespace lanbeam
