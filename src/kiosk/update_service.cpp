#include "kiosk/update_service.hpp"

#include "util/logger.hpp"

#include <exception>

namespace kiosk {

UpdateService::UpdateService(std::shared_ptr<UpdateCoordinator> coordinator)
    : coordinator_(std::move(coordinator)) {}

UpdateService::~UpdateService() {
    Stop();
    Wait();
}

bool UpdateService::RequestUpdate() {
    if (stopped_.load()) {
        LogWarn("update request ignored, service is stopping");
        return false;
    }

    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        coordinator_->ReportStatus("Update process is already running.");
        return false;
    }

    std::lock_guard<std::mutex> lk(worker_mu_);
    // in_flight_ was false, so a previous worker has already returned.
    if (worker_.joinable()) worker_.join();

    coordinator_->ReportStatus("Initializing USB update sequence...");
    worker_ = std::thread(&UpdateService::Worker, this);
    return true;
}

void UpdateService::Stop() {
    if (stopped_.exchange(true)) return;
    if (in_flight_.load()) {
        LogInfo("waiting for the running update to finish");
    }
}

void UpdateService::Wait() {
    std::lock_guard<std::mutex> lk(worker_mu_);
    if (worker_.joinable()) worker_.join();
}

std::optional<Result> UpdateService::LastOutcome() const {
    std::lock_guard<std::mutex> lk(outcome_mu_);
    return last_outcome_;
}

void UpdateService::Worker() {
    Result outcome;
    try {
        outcome = coordinator_->Run();
    } catch (const std::exception& e) {
        LogError("update worker: unexpected exception: %s", e.what());
        outcome = Result::Fail(ErrorCode::IoFailure, 0, std::string("unexpected error: ") + e.what());
    }

    if (outcome.is_ok()) {
        LogInfo("update attempt finished: success");
    } else {
        LogInfo("update attempt finished: %s: %s", ErrorCodeName(outcome.code), outcome.msg.c_str());
    }

    {
        std::lock_guard<std::mutex> lk(outcome_mu_);
        last_outcome_ = outcome;
    }
    coordinator_->ReportStatus("USB update process finished.");
    in_flight_.store(false);
}

} // namespace kiosk
