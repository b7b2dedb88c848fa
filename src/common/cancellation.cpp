#include "common/cancellation.hpp"

namespace backtail {

void CancellationToken::cancel()
{
    {
        std::lock_guard lg(mtx_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(Duration d)
{
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, d, [this] { return cancelled_.load(); });
}

void SteadySleeper::sleep_for(Duration d, CancellationToken& token)
{
    token.wait_for(d);
}

} // namespace backtail
