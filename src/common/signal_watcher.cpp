#include "common/signal_watcher.hpp"

#include <pthread.h>
#include <spdlog/spdlog.h>

namespace backtail {

SignalWatcher::SignalWatcher(CancellationToken& token) : token_(token)
{
    sigemptyset(&set_);
    sigaddset(&set_, SIGINT);
    sigaddset(&set_, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set_, nullptr);
    thread_ = std::thread([this]() { wait(); });
}

SignalWatcher::~SignalWatcher()
{
    stopping_ = true;
    // 线程已经因为真实信号退出时，pthread_kill 不会投递任何东西
    pthread_kill(thread_.native_handle(), SIGTERM);
    thread_.join();
}

void SignalWatcher::wait()
{
    int sig = 0;
    if (sigwait(&set_, &sig) != 0 || stopping_)
        return;
    spdlog::info("SignalWatcher: received signal {}, stopping", sig);
    token_.cancel();
}

} // namespace backtail
