#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "common/cancellation.hpp"
#include "common/tail_error.hpp"
#include "common/tail_options.hpp"
#include "reader/file_handle.hpp"
#include "reader/forward_line_splitter.hpp"
#include "tail/itail.h"

namespace backtail {

enum class FollowState {
    Initialized,
    Polling,
    Reading,
    Rotated,
    Stopped
};

const char* to_string(FollowState s);

/*==========================================================
 * follow 会话
 *
 * 单线程协作式循环：sleep -> poll -> sleep ...
 * 取消只在 sleep 前和每次 read 前检查，不会打断一行的拼装。
 * 句柄和游标只属于这一个会话。
 *=========================================================*/
class FollowEngine {
public:
    FollowEngine(std::string path,
                 long long n,
                 const TailOptions& opt,
                 LineCallback on_line,
                 std::shared_ptr<Sleeper> sleeper = nullptr);

    FollowEngine(const FollowEngine&)            = delete;
    FollowEngine& operator=(const FollowEngine&) = delete;

    // 打开文件，取最后 n 行作为滑动窗口的初始内容并输出，游标放到文件尾
    void start();

    // 执行一个 poll 周期（不 sleep），返回本周期到达的状态
    FollowState poll(CancellationToken& token);

    // start()（如未启动）后循环 sleep/poll 直到取消；不可恢复的错误向上抛
    void run(CancellationToken& token);

    const std::deque<std::string>& window() const noexcept { return window_; }
    std::uint64_t cursor() const noexcept { return cursor_; }
    FollowState state() const noexcept { return state_; }
    std::size_t rotations() const noexcept { return rotations_; }
    std::size_t emitted() const noexcept { return emitted_; }

private:
    // 读 [cursor_, end)；读的过程中文件变短返回 false，由调用方按截断处理
    bool read_appended(std::uint64_t end, CancellationToken& token);
    void rotate(CancellationToken& token);
    void reopen(CancellationToken& token);
    void seed(bool emit);
    std::string unterminated_tail(std::uint64_t size) const;
    void push_line(std::string line, bool emit);
    void on_recovery_pending(const TailError& e);

    std::string              path_;
    std::size_t              capacity_;
    TailOptions              opt_;
    LineCallback             on_line_;
    std::shared_ptr<Sleeper> sleeper_;

    FileHandle               file_;
    FileIdentity             identity_;
    std::uint64_t            cursor_    = 0;
    std::uint64_t            last_size_ = 0;
    ForwardLineSplitter      splitter_;
    std::deque<std::string>  window_;

    FollowState              state_         = FollowState::Initialized;
    bool                     started_       = false;
    bool                     recovering_    = false;   // 旧句柄已关，新文件还没打开
    unsigned                 pending_polls_ = 0;
    std::size_t              rotations_     = 0;
    std::size_t              emitted_       = 0;
};

} // namespace backtail
