#include "receiver_server.hpp"

#include "lanbeam/hash_stream.hpp"
#include "lanbeam/helpers.hpp"
#include "lanbeam/wire_protocol.hpp"

#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

namespace {

namespace fs = std::filesystem;
using lanbeam::FileDescriptor;
using lanbeam::HistoryRecord;
using lanbeam::OverwriteDecision;
using lanbeam::TransferStatus;

std::atomic<OverwriteDecision> next_decision{OverwriteDecision::Skip};
std::atomic<bool> slow_prompt{false};
std::mutex integrity_mutex;
std::vector<std::pair<std::string, bool>> integrity_events;

lanbeam::TransferObserver make_observer() {
    lanbeam::TransferObserver observer;
    observer.on_overwrite = [](const std::string &) {
        if (slow_prompt) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        }
        return lanbeam::OverwriteReply{next_decision.load(), true};
    };
    observer.on_integrity = [](const std::string &name, bool ok) {
        std::lock_guard<std::mutex> lock(integrity_mutex);
        integrity_events.emplace_back(name, ok);
    };
    return observer;
}

std::string digest_of(const std::string &data) {
    lanbeam::HashStream hash;
    hash.update(data);
    return hash.digest();
}

FileDescriptor describe(const std::string &name, const std::string &data) {
    return FileDescriptor{name, data.size(), digest_of(data)};
}

int connect_to(const uint16_t &port) {
    return lanbeam::connect_with_timeout(lanbeam::HostPort{"127.0.0.1", port}, std::chrono::milliseconds(2000));
}

// writes a manifest plus the given bodies, bodies may differ from the declared files
void send_raw(const uint16_t &port, const lanbeam::TransferManifest &manifest, const std::vector<std::string> &bodies) {
    int fd = connect_to(port);
    lanbeam::write_manifest(fd, manifest);
    for (const auto &body : bodies) {
        lanbeam::send_all(fd, body.data(), body.size());
    }
    ::close(fd);
}

// a session's private temp file, whatever its id
bool has_partial(const fs::path &inbox, const std::string &name) {
    for (const auto &entry : fs::directory_iterator(inbox)) {
        const std::string file = entry.path().filename().string();
        if (file.rfind(name + ".", 0) == 0 && entry.path().extension() == ".part") {
            return true;
        }
    }
    return false;
}

HistoryRecord wait_for_record(const lanbeam::HistoryLog &history, const size_t &count) {
    assert(lanbeam::test::wait_until([&] { return history.getRecords().size() >= count; }));
    return history.getRecords()[count - 1];
}

}  // namespace

int main() {
    lanbeam::test::TempDir dir("conflicts");
    lanbeam::EngineConfig config = lanbeam::test::local_config(dir, "recv");
    config.max_metadata_bytes = 4096;
    config.overwrite_timeout = std::chrono::milliseconds(300);
    config.chunk_size = 4096;

    auto duplicates = std::make_shared<lanbeam::DuplicateStore>(config.duplicates_file);
    auto history = std::make_shared<lanbeam::HistoryLog>(config.history_file);
    lanbeam::ReceiverServer server(config, duplicates, history, make_observer());
    assert(server.start());
    const uint16_t port = server.getPort();
    const fs::path inbox(config.download_dir);
    size_t records = 0;

    // existing file + skip -> untouched, not verified
    {
        lanbeam::test::write_file((inbox / "keep.txt").string(), "original");
        next_decision = OverwriteDecision::Skip;
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("keep.txt", "replacement text"), describe("fresh.txt", "new")};
        send_raw(port, manifest, {"replacement text", "new"});

        HistoryRecord record = wait_for_record(*history, ++records);
        assert(record.status == TransferStatus::Success);
        assert(record.verifiedText() == "1/2");
        assert(lanbeam::test::read_file((inbox / "keep.txt").string()) == "original");
        assert(lanbeam::test::read_file((inbox / "fresh.txt").string()) == "new");
    }

    // overwrite replaces the content
    {
        next_decision = OverwriteDecision::Overwrite;
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("keep.txt", "replacement text")};
        send_raw(port, manifest, {"replacement text"});
        HistoryRecord record = wait_for_record(*history, ++records);
        assert(record.verifiedText() == "1/1");
        assert(lanbeam::test::read_file((inbox / "keep.txt").string()) == "replacement text");
    }

    // wrong declared hash fails that file only
    {
        {
            std::lock_guard<std::mutex> lock(integrity_mutex);
            integrity_events.clear();
        }
        lanbeam::TransferManifest manifest;
        FileDescriptor bad = describe("bad.bin", "payload-two");
        bad.sha256_hex = digest_of("something else");
        manifest.files = {describe("good.bin", "payload-one"), bad, describe("tail.bin", std::string(10000, 'x'))};
        send_raw(port, manifest, {"payload-one", "payload-two", std::string(10000, 'x')});

        HistoryRecord record = wait_for_record(*history, ++records);
        assert(record.status == TransferStatus::Success);
        assert(record.verifiedText() == "2/3");
        assert(lanbeam::test::read_file((inbox / "bad.bin").string()) == "payload-two");
        assert(lanbeam::test::read_file((inbox / "tail.bin").string()) == std::string(10000, 'x'));

        std::lock_guard<std::mutex> lock(integrity_mutex);
        assert(integrity_events.size() == 3);
        assert(integrity_events[0].second);
        assert(integrity_events[1].first == "bad.bin" && !integrity_events[1].second);
        assert(integrity_events[2].second);
        assert(!duplicates->isDuplicate((inbox / "bad.bin").string(), bad.sha256_hex, "127.0.0.1").first);
        assert(duplicates->isDuplicate((inbox / "good.bin").string(), digest_of("payload-one"), "127.0.0.1").first);
    }

    // names are reduced to their base name inside the download directory
    {
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("../../escape.txt", "trapped"), describe("..", "nameless"), describe("dir\\win.txt", "win")};
        send_raw(port, manifest, {"trapped", "nameless", "win"});
        HistoryRecord record = wait_for_record(*history, ++records);
        assert(record.verifiedText() == "3/3");
        assert(lanbeam::test::read_file((inbox / "escape.txt").string()) == "trapped");
        assert(lanbeam::test::read_file((inbox / "unnamed_file").string()) == "nameless");
        assert(lanbeam::test::read_file((inbox / "win.txt").string()) == "win");
        assert(!fs::exists(inbox.parent_path().parent_path() / "escape.txt"));
    }

    // a prompt that never answers counts as skip
    {
        slow_prompt = true;
        next_decision = OverwriteDecision::Overwrite;
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("fresh.txt", "late")};
        send_raw(port, manifest, {"late"});
        HistoryRecord record = wait_for_record(*history, ++records);
        assert(record.verifiedText() == "0/1");
        assert(lanbeam::test::read_file((inbox / "fresh.txt").string()) == "new");
        slow_prompt = false;
    }

    // cancel-all stops the session
    {
        next_decision = OverwriteDecision::CancelAll;
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("first.txt", "1"), describe("keep.txt", "x"), describe("never.txt", "2")};
        int fd = connect_to(port);
        lanbeam::write_manifest(fd, manifest);
        lanbeam::send_all(fd, "1x2", 3);
        HistoryRecord record = wait_for_record(*history, ++records);
        ::close(fd);
        assert(record.status == TransferStatus::Cancelled);
        assert(record.verifiedText() == "1/3");
        assert(!fs::exists(inbox / "never.txt"));
    }

    // oversized metadata is refused
    {
        int fd = connect_to(port);
        auto prefix = lanbeam::encode_length_prefix(static_cast<uint32_t>(config.max_metadata_bytes + 1));
        lanbeam::send_all(fd, reinterpret_cast<const char*>(prefix.data()), prefix.size());
        HistoryRecord record = wait_for_record(*history, ++records);
        ::close(fd);
        assert(record.status == TransferStatus::Failed);
        assert(record.error.rfind("metadata_too_large", 0) == 0);
    }

    // malformed metadata
    {
        int fd = connect_to(port);
        const std::string junk = "{\"file_count\": 3, \"files\": []}";
        auto prefix = lanbeam::encode_length_prefix(static_cast<uint32_t>(junk.size()));
        lanbeam::send_all(fd, reinterpret_cast<const char*>(prefix.data()), prefix.size());
        lanbeam::send_all(fd, junk.data(), junk.size());
        HistoryRecord record = wait_for_record(*history, ++records);
        ::close(fd);
        assert(record.status == TransferStatus::Failed);
        assert(record.error.rfind("protocol_error", 0) == 0);
    }

    // sender vanishes mid-file -> failed, partial file removed
    {
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("cut.bin", std::string(50000, 'c'))};
        send_raw(port, manifest, {std::string(1000, 'c')});
        HistoryRecord record = wait_for_record(*history, ++records);
        assert(record.status == TransferStatus::Failed);
        assert(record.verifiedText() == "0/1");
        assert(!fs::exists(inbox / "cut.bin"));
        assert(!has_partial(inbox, "cut.bin"));
    }

    // paused session cancelled from the receiver side
    {
        server.pause();
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("paused.bin", std::string(20000, 'p'))};
        int fd = connect_to(port);
        lanbeam::write_manifest(fd, manifest);
        lanbeam::send_all(fd, std::string(20000, 'p').data(), 20000);
        assert(lanbeam::test::wait_until([&] { return server.activeSessions() == 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(!fs::exists(inbox / "paused.bin"));

        server.cancelAll();
        HistoryRecord record = wait_for_record(*history, ++records);
        ::close(fd);
        assert(record.status == TransferStatus::Cancelled);
        server.resume();
        assert(lanbeam::test::wait_until([&] { return !server.getControl().isCancelled(); }));
    }

    // two senders, one name: the second sees a conflict, not the first one's partial file
    {
        next_decision = OverwriteDecision::Skip;
        const std::string first = lanbeam::test::random_bytes(1024 * 1024, 31);
        const std::string second = lanbeam::test::random_bytes(1024 * 1024, 32);
        lanbeam::TransferManifest manifest_a;
        manifest_a.files = {describe("race.bin", first)};
        int fd = connect_to(port);
        lanbeam::write_manifest(fd, manifest_a);
        lanbeam::send_all(fd, first.data(), first.size() / 2);
        assert(lanbeam::test::wait_until([&] { return has_partial(inbox, "race.bin"); }));

        lanbeam::TransferManifest manifest_b;
        manifest_b.files = {describe("race.bin", second)};
        std::thread rival([&] { send_raw(port, manifest_b, {second}); });
        HistoryRecord skipped = wait_for_record(*history, ++records);
        rival.join();
        assert(skipped.status == TransferStatus::Success);
        assert(skipped.verifiedText() == "0/1");

        lanbeam::send_all(fd, first.data() + first.size() / 2, first.size() - first.size() / 2);
        HistoryRecord finished = wait_for_record(*history, ++records);
        ::close(fd);
        assert(finished.status == TransferStatus::Success);
        assert(finished.verifiedText() == "1/1");
        assert(lanbeam::test::read_file((inbox / "race.bin").string()) == first);
        assert(!has_partial(inbox, "race.bin"));
    }

    // overwrite waits for the first writer, then replaces its file
    {
        next_decision = OverwriteDecision::Overwrite;
        const std::string first = lanbeam::test::random_bytes(1024 * 1024, 33);
        const std::string second = lanbeam::test::random_bytes(1024 * 1024, 34);
        lanbeam::TransferManifest manifest_a;
        manifest_a.files = {describe("race2.bin", first)};
        int fd = connect_to(port);
        lanbeam::write_manifest(fd, manifest_a);
        lanbeam::send_all(fd, first.data(), first.size() / 2);
        assert(lanbeam::test::wait_until([&] { return has_partial(inbox, "race2.bin"); }));

        lanbeam::TransferManifest manifest_b;
        manifest_b.files = {describe("race2.bin", second)};
        std::thread rival([&] { send_raw(port, manifest_b, {second}); });
        assert(lanbeam::test::wait_until([&] { return server.activeSessions() == 2; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        lanbeam::send_all(fd, first.data() + first.size() / 2, first.size() - first.size() / 2);
        records += 2;
        wait_for_record(*history, records);
        ::close(fd);
        rival.join();
        auto all = history->getRecords();
        assert(all[records - 2].verifiedText() == "1/1");
        assert(all[records - 1].verifiedText() == "1/1");
        assert(lanbeam::test::read_file((inbox / "race2.bin").string()) == second);
        assert(!has_partial(inbox, "race2.bin"));
    }

    // a prompt still running after its server is gone only touches what it owns
    {
        auto answered = std::make_shared<std::atomic<bool>>(false);
        lanbeam::EngineConfig slow_config = lanbeam::test::local_config(dir, "slow");
        slow_config.overwrite_timeout = std::chrono::milliseconds(100);
        lanbeam::test::write_file((fs::path(slow_config.download_dir) / "held.txt").string(), "old");
        auto slow_history = std::make_shared<lanbeam::HistoryLog>("");
        {
            lanbeam::TransferObserver observer;
            observer.on_overwrite = [answered](const std::string &) {
                std::this_thread::sleep_for(std::chrono::milliseconds(800));
                answered->store(true);
                return lanbeam::OverwriteReply{OverwriteDecision::Overwrite, true};
            };
            lanbeam::ReceiverServer slow(slow_config, std::make_shared<lanbeam::DuplicateStore>(""), slow_history, observer);
            assert(slow.start());
            lanbeam::TransferManifest manifest;
            manifest.files = {describe("held.txt", "new")};
            send_raw(slow.getPort(), manifest, {"new"});
            HistoryRecord record = wait_for_record(*slow_history, 1);
            assert(record.verifiedText() == "0/1");
            assert(!answered->load());
        }
        assert(lanbeam::test::wait_until([&] { return answered->load(); }));
        assert(lanbeam::test::read_file((fs::path(slow_config.download_dir) / "held.txt").string()) == "old");
    }

    // connections above the cap are closed straight away
    {
        lanbeam::EngineConfig capped_config = lanbeam::test::local_config(dir, "capped");
        capped_config.max_inbound_sessions = 1;
        lanbeam::ReceiverServer capped(capped_config, std::make_shared<lanbeam::DuplicateStore>(""), nullptr);
        assert(capped.start());

        int held = connect_to(capped.getPort());
        assert(lanbeam::test::wait_until([&] { return capped.activeSessions() == 1; }));
        int refused = connect_to(capped.getPort());
        char byte;
        lanbeam::set_socket_timeout(refused, std::chrono::milliseconds(3000));
        assert(::recv(refused, &byte, 1, 0) == 0);
        ::close(refused);
        ::close(held);
        capped.stop();
    }

    // stopping the server mid-transfer -> interrupted
    {
        lanbeam::TransferManifest manifest;
        manifest.files = {describe("half.bin", std::string(100000, 'h'))};
        int fd = connect_to(port);
        lanbeam::write_manifest(fd, manifest);
        lanbeam::send_all(fd, std::string(5000, 'h').data(), 5000);
        assert(lanbeam::test::wait_until([&] { return server.activeSessions() == 1; }));
        server.stop();
        HistoryRecord record = wait_for_record(*history, ++records);
        ::close(fd);
        assert(record.status == TransferStatus::Interrupted);
        assert(!server.isRunning());
    }

    return 0;
}
