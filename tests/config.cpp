#include "lanbeam/config.hpp"
#include "lanbeam/helpers.hpp"

#include "test_support.hpp"

#include <cassert>
#include <functional>
#include <stdexcept>
#include <string>

namespace {

bool rejected(const std::function<void()> &action) {
    try {
        action();
    } catch (const std::runtime_error &e) {
        return lanbeam::error_code(e) == "invalid_config";
    }
    return false;
}

}  // namespace

int main() {
    using lanbeam::EngineConfig;
    lanbeam::set_log_quiet(true);
    lanbeam::test::TempDir dir("config");

    {
        EngineConfig config;
        assert(config.discovery_port == 5000);
        assert(config.transfer_port == 5001);
        assert(config.chunk_size == 512 * 1024);
        assert(config.max_concurrent_transfers == 4);
        assert(config.connect_timeout.count() == 8000);
        assert(config.io_timeout.count() == 30000);
        assert(config.discovery_window.count() == 4000);
        assert(config.max_metadata_bytes == 10 * 1024 * 1024);
        lanbeam::validate_config(config);
    }

    {
        EngineConfig config = lanbeam::default_config();
        assert(config.device_name.rfind("LANBeam-", 0) == 0);
        assert(!config.duplicates_file.empty());
        assert(!config.history_file.empty());
    }

    // bounds
    lanbeam::validate_chunk_size(1024);
    lanbeam::validate_chunk_size(10 * 1024 * 1024);
    assert(rejected([] { lanbeam::validate_chunk_size(1023); }));
    assert(rejected([] { lanbeam::validate_chunk_size(10 * 1024 * 1024 + 1); }));
    lanbeam::validate_concurrency(1);
    lanbeam::validate_concurrency(10);
    assert(rejected([] { lanbeam::validate_concurrency(0); }));
    assert(rejected([] { lanbeam::validate_concurrency(11); }));
    assert(rejected([] {
        EngineConfig config;
        config.device_name.clear();
        lanbeam::validate_config(config);
    }));

    // missing file -> the base values
    {
        EngineConfig base;
        base.device_name = "base";
        EngineConfig loaded = lanbeam::load_config(dir.path("absent.json"), base);
        assert(loaded.device_name == "base");
    }

    // save then load, missing keys keep defaults
    {
        EngineConfig config;
        config.device_name = "kitchen-pc";
        config.transfer_port = 6001;
        config.chunk_size = 64 * 1024;
        config.connect_timeout = std::chrono::milliseconds(1234);
        config.broadcast_addresses = {"192.168.1.255"};
        lanbeam::save_config(dir.path("full.json"), config);

        EngineConfig loaded = lanbeam::load_config(dir.path("full.json"), EngineConfig{});
        assert(loaded.device_name == "kitchen-pc");
        assert(loaded.transfer_port == 6001);
        assert(loaded.chunk_size == 64 * 1024);
        assert(loaded.connect_timeout.count() == 1234);
        assert(loaded.broadcast_addresses.size() == 1 && loaded.broadcast_addresses[0] == "192.168.1.255");

        lanbeam::test::write_file(dir.path("partial.json"), R"({"max_concurrent_transfers": 2})");
        EngineConfig partial = lanbeam::load_config(dir.path("partial.json"), EngineConfig{});
        assert(partial.max_concurrent_transfers == 2);
        assert(partial.transfer_port == 5001);
    }

    // bad files are rejected
    lanbeam::test::write_file(dir.path("broken.json"), "{");
    assert(rejected([&] { lanbeam::load_config(dir.path("broken.json"), EngineConfig{}); }));
    lanbeam::test::write_file(dir.path("wrong_type.json"), R"({"chunk_size": "big"})");
    assert(rejected([&] { lanbeam::load_config(dir.path("wrong_type.json"), EngineConfig{}); }));
    lanbeam::test::write_file(dir.path("out_of_range.json"), R"({"max_concurrent_transfers": 50})");
    assert(rejected([&] { lanbeam::load_config(dir.path("out_of_range.json"), EngineConfig{}); }));

    return 0;
}
