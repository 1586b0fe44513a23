#pragma once

#include "kiosk/update_coordinator.hpp"
#include "util/result.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace kiosk {

// Runs update attempts on a background thread, at most one at a time.
class UpdateService {
  public:
    explicit UpdateService(std::shared_ptr<UpdateCoordinator> coordinator);
    ~UpdateService();

    UpdateService(const UpdateService&) = delete;
    UpdateService& operator=(const UpdateService&) = delete;

    // Starts an attempt and returns immediately. Returns false, and reports
    // "Update process is already running.", while another attempt is in flight.
    bool RequestUpdate();

    // Refuses further requests. An attempt in flight still runs to completion.
    void Stop();
    // Blocks until the current attempt, if any, has finished.
    void Wait();

    bool IsRunning() const { return in_flight_.load(); }
    std::optional<Result> LastOutcome() const;

  private:
    void Worker();

    std::shared_ptr<UpdateCoordinator> coordinator_;
    std::atomic<bool> in_flight_{false};
    std::atomic<bool> stopped_{false};

    std::mutex worker_mu_;
    std::thread worker_;

    mutable std::mutex outcome_mu_;
    std::optional<Result> last_outcome_;
};

} // namespace kiosk
