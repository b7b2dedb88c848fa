#pragma once

#include <signal.h>

#include <atomic>
#include <thread>

#include "common/cancellation.hpp"

namespace backtail {

// SIGINT / SIGTERM 转成取消；在专门的线程里 sigwait，不在信号处理函数里碰锁。
// 构造时在调用线程屏蔽这两个信号，应在启动其他线程之前创建。
// 析构时用 pthread_kill 唤醒并 join，线程不会比 token 活得久。
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& token);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&)            = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void wait();

    CancellationToken& token_;
    sigset_t           set_;
    std::atomic<bool>  stopping_{false};
    std::thread        thread_;
};

} // namespace backtail
