#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace backtail {

using Clock    = std::chrono::steady_clock;
using Duration = std::chrono::milliseconds;

// 跨线程取消标志；follow 循环只在 poll 边界检查它
class CancellationToken {
public:
    void cancel();
    bool cancelled() const noexcept { return cancelled_.load(); }

    // 等待 d 或被取消，返回 true 表示已取消
    bool wait_for(Duration d);

private:
    std::atomic<bool>       cancelled_{false};
    std::mutex              mtx_;
    std::condition_variable cv_;
};

// follow 循环唯一的挂起点，测试里换成假实现
class Sleeper {
public:
    virtual ~Sleeper() = default;
    virtual void sleep_for(Duration d, CancellationToken& token) = 0;
};

class SteadySleeper : public Sleeper {
public:
    void sleep_for(Duration d, CancellationToken& token) override;
};

} // namespace backtail
