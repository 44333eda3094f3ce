#include "receive_session.hpp"
#include "receiver_server.hpp"

#include "lanbeam/log.hpp"

#include <future>
#include <memory>
#include <thread>

namespace lanbeam {

OverwriteDecision ReceiveSession::resolveConflict(const std::string &file_name) {
    if (this->sticky_decision) {
        return *this->sticky_decision;
    }
    OverwriteReply reply = this->askOverwrite(file_name);
    if (reply.apply_to_all) {
        this->sticky_decision = reply.decision;
    }
    log_info("Existing " + file_name + ": " + to_string(reply.decision) + (reply.apply_to_all ? " (remaining conflicts too)" : ""));
    return reply.decision;
}

// asks the front-end on its own thread, Skip when it doesn't answer in time
OverwriteReply ReceiveSession::askOverwrite(const std::string &file_name) const {
    const TransferObserver &observer = this->server.getObserver();
    if (!observer.on_overwrite) {
        return OverwriteReply{OverwriteDecision::Skip, true};
    }

    auto promise = std::make_shared<std::promise<OverwriteReply>>();
    std::future<OverwriteReply> answer = promise->get_future();
    auto callback = observer.on_overwrite;
    std::thread([promise, callback, file_name]() {
        try {
            promise->set_value(callback(file_name));
        } catch (const std::exception &) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    const auto timeout = this->server.getConfig().overwrite_timeout;
    if (answer.wait_for(timeout) != std::future_status::ready) {
        log_warning("No overwrite decision for " + file_name + " within " + std::to_string(timeout.count()) + " ms, skipping");
        return OverwriteReply{OverwriteDecision::Skip, false};
    }
    try {
        return answer.get();
    } catch (const std::exception &e) {
        log_warning("Overwrite prompt for " + file_name + " failed: " + e.what());
        return OverwriteReply{OverwriteDecision::Skip, false};
    }
}

} // namespace lanbeam
