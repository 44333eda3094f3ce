#include "lanbeam/history_log.hpp"

#include "test_support.hpp"

#include <cassert>
#include <string>

namespace {

lanbeam::HistoryRecord make_record(const std::string &peer, const lanbeam::TransferStatus &status) {
    lanbeam::HistoryRecord record;
    record.time = "2024-05-01 12:00:00";
    record.direction = lanbeam::Direction::Receive;
    record.peer = peer;
    record.file_count = 2;
    record.total_bytes = 11 * 1024 * 1024;
    record.duration_seconds = 1.5;
    record.verified = 2;
    record.verified_total = 2;
    record.status = status;
    record.device = "desk";
    return record;
}

}  // namespace

int main() {
    using lanbeam::HistoryLog;
    lanbeam::set_log_quiet(true);
    lanbeam::test::TempDir dir("history");

    {
        HistoryLog history(dir.path("history.json"));
        assert(history.getRecords().empty());
        history.append(make_record("10.0.0.5", lanbeam::TransferStatus::Success));
        auto failed = make_record("10.0.0.6", lanbeam::TransferStatus::Failed);
        failed.verified = 0;
        failed.error = "connect_failed: refused";
        history.append(failed);
    }

    {
        HistoryLog reopened(dir.path("history.json"));
        auto records = reopened.getRecords();
        assert(records.size() == 2);
        assert(records[0].peer == "10.0.0.5");
        assert(records[0].direction == lanbeam::Direction::Receive);
        assert(records[0].status == lanbeam::TransferStatus::Success);
        assert(records[0].verifiedText() == "2/2");
        assert(records[0].total_bytes == 11 * 1024 * 1024);
        assert(records[1].status == lanbeam::TransferStatus::Failed);
        assert(records[1].verifiedText() == "0/2");
        assert(records[1].error == "connect_failed: refused");

        reopened.exportTo(dir.path("export.json"));
        assert(HistoryLog(dir.path("export.json")).getRecords().size() == 2);

        reopened.clear();
        assert(HistoryLog(dir.path("history.json")).getRecords().empty());
    }

    // oldest dropped past the cap
    {
        HistoryLog history("");
        for (size_t i = 0; i < lanbeam::MAX_HISTORY_RECORDS + 5; i++) {
            history.append(make_record("peer-" + std::to_string(i), lanbeam::TransferStatus::Success));
        }
        auto records = history.getRecords();
        assert(records.size() == lanbeam::MAX_HISTORY_RECORDS);
        assert(records.front().peer == "peer-5");
    }

    lanbeam::test::write_file(dir.path("corrupt.json"), "[{");
    assert(HistoryLog(dir.path("corrupt.json")).getRecords().empty());

    // wrong field types load as an empty log instead of throwing
    lanbeam::test::write_file(dir.path("typed.json"), "[{\"time\": 12, \"peer\": [\"x\"], \"status\": \"Success\"}]");
    {
        HistoryLog typed(dir.path("typed.json"));
        assert(typed.getRecords().empty());
        typed.append(make_record("10.0.0.7", lanbeam::TransferStatus::Success));
        assert(HistoryLog(dir.path("typed.json")).getRecords().size() == 1);
    }

    return 0;
}
