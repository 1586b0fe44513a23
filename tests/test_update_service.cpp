#include "kiosk/update_service.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kiosk {
namespace {

// Holds the first Locate() until the test releases it.
class BlockingMedia final : public IMediaSource {
public:
    explicit BlockingMedia(std::shared_future<void> release) : release_(std::move(release)) {}

    std::promise<void> entered;
    std::atomic<int> locate_calls{0};

    std::optional<std::string> Locate() override {
        if (++locate_calls == 1) entered.set_value();
        release_.wait();
        return std::nullopt;
    }

    bool Unmount(const std::string&) override { return true; }

private:
    std::shared_future<void> release_;
};

class UpdateServiceTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::promise<void> release;
    std::shared_ptr<BlockingMedia> media = std::make_shared<BlockingMedia>(release.get_future().share());

    std::mutex mu;
    std::vector<std::string> statuses;
    CallbackStatusSink sink{[this](std::string_view m) {
        std::lock_guard<std::mutex> lk(mu);
        statuses.emplace_back(m);
    }};

    std::shared_ptr<UpdateCoordinator> MakeCoordinator() {
        UpdateLayout layout;
        layout.app_root = tmp.Path();
        auto coordinator = std::make_shared<UpdateCoordinator>(layout, media);
        coordinator->SetStatusSink(&sink);
        return coordinator;
    }

    int CountStatus(const std::string& message) {
        std::lock_guard<std::mutex> lk(mu);
        int n = 0;
        for (const auto& s : statuses) n += (s == message);
        return n;
    }
};

TEST_F(UpdateServiceTest, RejectsSecondRequestWhileRunning) {
    auto coordinator = MakeCoordinator();
    UpdateService service(coordinator);

    ASSERT_TRUE(service.RequestUpdate());
    media->entered.get_future().wait();

    EXPECT_TRUE(service.IsRunning());
    EXPECT_EQ(coordinator->State(), UpdateState::Locating);
    EXPECT_FALSE(service.RequestUpdate());
    EXPECT_EQ(CountStatus("Update process is already running."), 1);

    release.set_value();
    service.Wait();

    EXPECT_FALSE(service.IsRunning());
    EXPECT_EQ(media->locate_calls.load(), 1);
    EXPECT_EQ(CountStatus("USB update process finished."), 1);

    const auto outcome = service.LastOutcome();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->code, ErrorCode::MediaNotFound);
}

TEST_F(UpdateServiceTest, AcceptsNewRequestAfterCompletion) {
    release.set_value();
    UpdateService service(MakeCoordinator());
    EXPECT_FALSE(service.LastOutcome().has_value());

    ASSERT_TRUE(service.RequestUpdate());
    service.Wait();
    ASSERT_TRUE(service.RequestUpdate());
    service.Wait();

    EXPECT_EQ(media->locate_calls.load(), 2);
    EXPECT_EQ(CountStatus("USB update process finished."), 2);
}

TEST_F(UpdateServiceTest, StopRefusesNewRequests) {
    release.set_value();
    UpdateService service(MakeCoordinator());

    service.Stop();
    EXPECT_FALSE(service.RequestUpdate());
    EXPECT_EQ(media->locate_calls.load(), 0);
}

TEST_F(UpdateServiceTest, DestructorWaitsForRunningAttempt) {
    auto coordinator = MakeCoordinator();
    {
        UpdateService service(coordinator);
        ASSERT_TRUE(service.RequestUpdate());
        media->entered.get_future().wait();
        release.set_value();
    }
    EXPECT_EQ(coordinator->State(), UpdateState::Idle);
    EXPECT_EQ(CountStatus("USB update process finished."), 1);
}

} // namespace
} // namespace kiosk
