#include "receiver_server.hpp"
#include "transfer_scheduler.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

bool throws_code(const std::function<void()> &fn, const std::string &code) {
    try {
        fn();
    } catch (const std::runtime_error &e) {
        return std::string(e.what()).rfind(code + ":", 0) == 0;
    }
    return false;
}

size_t count_state(const lanbeam::TransferScheduler &scheduler, const lanbeam::JobState &state) {
    auto jobs = scheduler.getJobs();
    return static_cast<size_t>(std::count_if(jobs.begin(), jobs.end(), [&](const lanbeam::JobSnapshot &s) {
        return s.state == state;
    }));
}

}  // namespace

int main() {
    lanbeam::test::TempDir dir("scheduler");
    for (int i = 0; i < 4; i++) {
        lanbeam::test::write_file(dir.path("outbox/f" + std::to_string(i) + ".bin"),
                                  lanbeam::test::random_bytes(256 * 1024, static_cast<uint32_t>(i + 10)));
    }

    lanbeam::EngineConfig recv_config = lanbeam::test::local_config(dir, "recv");
    recv_config.io_timeout = std::chrono::milliseconds(30000);
    recv_config.overwrite_timeout = std::chrono::milliseconds(200);
    lanbeam::ReceiverServer server(recv_config, std::make_shared<lanbeam::DuplicateStore>(""), nullptr);
    assert(server.start());
    const std::string peer = "127.0.0.1:" + std::to_string(server.getPort());

    lanbeam::EngineConfig config = lanbeam::test::local_config(dir, "send");
    config.max_concurrent_transfers = 2;
    config.chunk_size = 16 * 1024;
    auto history = std::make_shared<lanbeam::HistoryLog>(config.history_file);
    lanbeam::TransferScheduler scheduler(config, std::make_shared<lanbeam::DuplicateStore>(config.duplicates_file), history);

    // settings are validated and left alone on error
    {
        assert(throws_code([&] { scheduler.setConcurrency(0); }, "invalid_config"));
        assert(throws_code([&] { scheduler.setConcurrency(11); }, "invalid_config"));
        assert(throws_code([&] { scheduler.setChunkSize(512); }, "invalid_config"));
        assert(throws_code([&] { scheduler.setChunkSize(11 * 1024 * 1024); }, "invalid_config"));
        assert(scheduler.getConcurrency() == 2);
        assert(scheduler.getChunkSize() == 16 * 1024);
        scheduler.setChunkSize(8 * 1024);
        assert(scheduler.getChunkSize() == 8 * 1024);

        assert(throws_code([&] { scheduler.submit(peer, {}); }, "no_files"));
        assert(throws_code([&] { scheduler.submit("", {dir.path("outbox/f0.bin")}); }, "invalid_address"));
        assert(!scheduler.getState("job-404").has_value());

        lanbeam::EngineConfig bad = config;
        bad.max_concurrent_transfers = 0;
        assert(throws_code([&] {
            lanbeam::TransferScheduler broken(bad, std::make_shared<lanbeam::DuplicateStore>(""), nullptr);
        }, "invalid_config"));
        assert(throws_code([&] {
            lanbeam::TransferScheduler broken(config, nullptr, nullptr);
        }, "invalid_config"));
    }

    // at most two run, the rest wait in order; pause holds bytes where they are
    {
        scheduler.pause();
        assert(scheduler.isPaused());
        std::vector<std::string> ids;
        for (int i = 0; i < 4; i++) {
            ids.push_back(scheduler.submit(peer, {dir.path("outbox/f" + std::to_string(i) + ".bin")}));
        }
        assert(ids[0] == "job-1" && ids[3] == "job-4");
        assert(lanbeam::test::wait_until([&] { return count_state(scheduler, lanbeam::JobState::Transferring) == 2; }));
        assert(scheduler.activeCount() == 2);
        assert(scheduler.queuedCount() == 2);
        assert(scheduler.getState(ids[2]) == lanbeam::JobState::Queued);
        assert(scheduler.getState(ids[3]) == lanbeam::JobState::Queued);

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        for (const auto &job : scheduler.getJobs()) {
            assert(job.bytes_done == 0);
        }
        assert(!scheduler.waitIdle(std::chrono::milliseconds(100)));

        // cancel reaches running and queued jobs alike
        scheduler.cancelAll();
        assert(scheduler.waitIdle(std::chrono::milliseconds(10000)));
        assert(count_state(scheduler, lanbeam::JobState::Cancelled) == 4);
        auto records = history->getRecords();
        assert(records.size() == 4);
        assert(std::all_of(records.begin(), records.end(), [](const lanbeam::HistoryRecord &r) {
            return r.status == lanbeam::TransferStatus::Cancelled && r.direction == lanbeam::Direction::Send;
        }));
        assert(scheduler.activeCount() == 0);
        assert(scheduler.queuedCount() == 0);
    }

    // after a cancel, new work runs again once resumed
    {
        scheduler.resume();
        assert(!scheduler.isPaused());
        const std::string job = scheduler.submit(peer, {dir.path("outbox/f0.bin"), dir.path("outbox/f1.bin")});
        assert(scheduler.waitIdle(std::chrono::milliseconds(30000)));
        assert(scheduler.getState(job) == lanbeam::JobState::Completed);
        assert(history->getRecords().back().verifiedText() == "2/2");
    }

    // pause mid-stream: bytes stop moving until resumed
    {
        lanbeam::test::write_file(dir.path("outbox/large.bin"), lanbeam::test::random_bytes(8 * 1024 * 1024, 99));
        scheduler.setChunkSize(1024);
        const std::string job = scheduler.submit(peer, {dir.path("outbox/large.bin")});
        assert(lanbeam::test::wait_until([&] {
            auto jobs = scheduler.getJobs();
            return jobs.back().bytes_done > 0;
        }));
        scheduler.pause();
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        uint64_t frozen = scheduler.getJobs().back().bytes_done;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        uint64_t later = scheduler.getJobs().back().bytes_done;
        assert(later == frozen);
        if (frozen < 8 * 1024 * 1024) {
            assert(scheduler.getState(job) == lanbeam::JobState::Transferring);
        }
        scheduler.resume();
        assert(scheduler.waitIdle(std::chrono::milliseconds(60000)));
        assert(scheduler.getState(job) == lanbeam::JobState::Completed);
        assert(scheduler.getJobs().back().bytes_done == 8 * 1024 * 1024);
    }

    // failures end the job, not the scheduler
    {
        const std::string refused = scheduler.submit("127.0.0.1:1", {dir.path("outbox/f0.bin")});
        const std::string missing = scheduler.submit(peer, {dir.path("outbox/nope.bin")});
        assert(scheduler.waitIdle(std::chrono::milliseconds(10000)));
        assert(scheduler.getState(refused) == lanbeam::JobState::Failed);
        assert(scheduler.getState(missing) == lanbeam::JobState::Failed);

        auto records = history->getRecords();
        size_t failed = static_cast<size_t>(std::count_if(records.begin(), records.end(), [](const lanbeam::HistoryRecord &r) {
            return r.status == lanbeam::TransferStatus::Failed;
        }));
        assert(failed == 2);
        bool saw_missing = std::any_of(records.begin(), records.end(), [](const lanbeam::HistoryRecord &r) {
            return r.error.rfind("file_open_failed", 0) == 0;
        });
        assert(saw_missing);
    }

    // cancel with nothing running leaves later jobs alone
    {
        scheduler.cancelAll();
        const std::string job = scheduler.submit(peer, {dir.path("outbox/f3.bin")});
        assert(scheduler.waitIdle(std::chrono::milliseconds(30000)));
        assert(scheduler.getState(job) == lanbeam::JobState::Completed);
    }

    server.stop();
    return 0;
}
