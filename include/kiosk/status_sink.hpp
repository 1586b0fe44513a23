#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace kiosk {

// One-way status channel towards whatever renders text on the device screen.
class IStatusSink {
  public:
    virtual ~IStatusSink() = default;
    virtual void DisplayStatus(std::string_view message) = 0;
};

// Rewrites a small JSON document ({"seq":N,"time":T,"message":"..."}) through
// a temp file and rename, so a polling renderer never reads a torn write.
class FileStatusSink final : public IStatusSink {
  public:
    explicit FileStatusSink(std::string path);

    void DisplayStatus(std::string_view message) override;

  private:
    std::string path_;
    std::mutex mu_;
    std::uint64_t seq_ = 0;
};

// In-process renderer hook.
class CallbackStatusSink final : public IStatusSink {
  public:
    using Callback = std::function<void(std::string_view)>;

    explicit CallbackStatusSink(Callback cb) : cb_(std::move(cb)) {}

    void DisplayStatus(std::string_view message) override {
        if (cb_) cb_(message);
    }

  private:
    Callback cb_;
};

} // namespace kiosk
