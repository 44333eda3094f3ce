#pragma once

#include "lanbeam/config.hpp"
#include "lanbeam/duplicate_store.hpp"
#include "lanbeam/progress_meter.hpp"
#include "lanbeam/transfer_control.hpp"
#include "lanbeam/transfer_types.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace lanbeam {

struct SourceFile {
    std::string path;
    FileDescriptor descriptor;
};

// regular files of the given paths, directories expanded recursively (sorted)
std::vector<std::string> collect_files(const std::vector<std::string> &paths);

// hashes every file, throws no_files / file_open_failed / file_read_failed
std::vector<SourceFile> describe_files(const std::vector<std::string> &paths);

// earlier sends of this exact content to peer, empty when none
std::vector<DuplicateRecord> prior_sends(const DuplicateStore &store, const SourceFile &source, const std::string &peer_address);

// drives one outbound transfer from hashing to the last byte
class SenderSession {
public:
    SenderSession(const std::string &job_id,
                  const std::string &peer_address,
                  const std::vector<std::string> &paths,
                  const EngineConfig &config,
                  DuplicateStore &duplicates,
                  TransferControl &control,
                  const TransferObserver &observer);

    // never throws, produces exactly one history record
    HistoryRecord run();
    // for jobs cancelled while still queued
    HistoryRecord abandon();

    const std::string &getId() const;
    const std::string &getPeer() const;
    JobState getState() const;
    uint64_t bytesSent() const;
    uint64_t totalBytes() const;
    size_t fileCount() const;

private:
    const std::string job_id;
    const std::string peer_address;
    const std::vector<std::string> paths;
    const EngineConfig config;
    DuplicateStore &duplicates;
    TransferControl &control;
    const TransferObserver &observer;

    std::vector<SourceFile> sources;
    std::atomic<JobState> state{JobState::Queued};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> total_bytes{0};
    std::atomic<size_t> file_count{0};
    size_t files_done = 0;
    std::string current_file;

    void setState(const JobState &new_state);
    void reportDuplicates() const;
    int openConnection() const;
    void streamFile(const int &fd, const SourceFile &source, std::vector<char> &buffer, ProgressMeter &meter);
    void report(ProgressMeter &meter, const bool &force);
    HistoryRecord baseRecord() const;
};

} // namespace lanbeam
