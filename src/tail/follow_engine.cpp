#include "tail/follow_engine.hpp"

#include <utility>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "reader/byte_window_reader.hpp"
#include "tail/rotation_detector.hpp"
#include "tail/tail_extractor.hpp"

namespace backtail {

const char* to_string(FollowState s)
{
    switch (s) {
    case FollowState::Initialized: return "initialized";
    case FollowState::Polling:     return "polling";
    case FollowState::Reading:     return "reading";
    case FollowState::Rotated:     return "rotated";
    case FollowState::Stopped:     return "stopped";
    }
    return "unknown";
}

FollowEngine::FollowEngine(std::string path,
                           long long n,
                           const TailOptions& opt,
                           LineCallback on_line,
                           std::shared_ptr<Sleeper> sleeper)
    : path_(std::move(path)),
      capacity_(n > 0 ? static_cast<std::size_t>(n) : 0),
      opt_(opt),
      on_line_(std::move(on_line)),
      sleeper_(sleeper ? std::move(sleeper) : std::make_shared<SteadySleeper>()),
      splitter_(opt)
{
    opt_.validate();
}

// -------------------- 生命周期 --------------------
void FollowEngine::start()
{
    if (started_)
        return;
    // 打开时的 FileNotFound / PermissionDenied 直接抛给调用方
    file_ = FileHandle::open(path_);
    identity_ = file_.identity();
    seed(true);
    started_ = true;
    state_ = FollowState::Polling;
    spdlog::info("FollowEngine: following {} from offset {} ({} line(s) seeded)",
                 path_, cursor_, window_.size());
}

void FollowEngine::run(CancellationToken& token)
{
    start();
    while (!token.cancelled()) {
        sleeper_->sleep_for(opt_.pollInterval, token);
        if (token.cancelled())
            break;
        poll(token);
    }
    state_ = FollowState::Stopped;
    spdlog::info("FollowEngine: stopped following {} ({} line(s) emitted, {} rotation(s))",
                 path_, emitted_, rotations_);
}

FollowState FollowEngine::poll(CancellationToken& token)
{
    start();
    if (token.cancelled()) {
        state_ = FollowState::Stopped;
        return state_;
    }

    state_ = FollowState::Polling;
    try {
        if (recovering_) {
            reopen(token);
            return state_;
        }

        auto check = RotationDetector::detect(identity_, last_size_, path_);
        pending_polls_ = 0;
        if (check.state != RotationState::Unchanged) {
            spdlog::info("FollowEngine: {} {} (size {} -> {}), reopening",
                         path_, to_string(check.state), last_size_, check.current.size);
            rotate(token);
            return state_;
        }

        last_size_ = check.current.size;
        if (check.current.size > cursor_) {
            state_ = FollowState::Reading;
            if (!read_appended(check.current.size, token))
                rotate(token);
        }
    } catch (const TailError& e) {
        if (e.kind() != ErrorKind::RotationRecoveryPending) {
            spdlog::error("FollowEngine: giving up on {}: {}", path_, e.what());
            state_ = FollowState::Stopped;
            throw;
        }
        on_recovery_pending(e);
    }
    return state_;
}

// -------------------- 读 / 轮转 --------------------
bool FollowEngine::read_appended(std::uint64_t end, CancellationToken& token)
{
    ByteWindowReader reader(file_, opt_.windowSizeBytes);
    while (cursor_ < end) {
        if (token.cancelled())
            return true;
        Window w;
        try {
            w = reader.read_forward(cursor_, end);
        } catch (const TailError& e) {
            // stat 之后、pread 之前被截断（copytruncate），提前读到了 EOF
            if (e.kind() != ErrorKind::IOFailure || file_.size() >= end)
                throw;
            spdlog::info("FollowEngine: {} shrank below {} bytes while reading, treating as truncation",
                         path_, end);
            return false;
        }
        cursor_ = w.cursor;
        splitter_.feed(w.bytes, [this](std::string line) { push_line(std::move(line), true); });
    }
    SPDLOG_DEBUG("FollowEngine: {} cursor at {}, {} pending byte(s)",
                 path_, cursor_, splitter_.pending_bytes());
    return true;
}

void FollowEngine::rotate(CancellationToken& token)
{
    ++rotations_;
    state_ = FollowState::Rotated;
    splitter_.reset();
    cursor_    = 0;
    last_size_ = 0;
    file_.close();
    recovering_ = true;
    reopen(token);
}

void FollowEngine::reopen(CancellationToken& token)
{
    try {
        file_ = FileHandle::open(path_);
    } catch (const TailError& e) {
        // 新文件可能还没建出来，下个周期再试
        if (e.kind() == ErrorKind::FileNotFound)
            throw TailError(ErrorKind::RotationRecoveryPending, e.what());
        throw;
    }
    recovering_    = false;
    pending_polls_ = 0;
    state_         = FollowState::Rotated;
    identity_      = file_.identity();

    if (opt_.reopenFrom == ReopenFrom::End) {
        seed(false);
    } else {
        window_.clear();
        cursor_    = 0;
        last_size_ = identity_.size;
        if (!read_appended(identity_.size, token)) {
            // 刚打开又被截断，下个周期从头再读
            splitter_.reset();
            cursor_    = 0;
            last_size_ = 0;
        }
    }
    spdlog::info("FollowEngine: reopened {} (inode {}, {} bytes), resuming at offset {}",
                 path_, identity_.inode, identity_.size, cursor_);
}

void FollowEngine::seed(bool emit)
{
    // 末尾没有换行的那一段还不是完整的行：不输出，原始字节交给 splitter 等换行
    const std::uint64_t size = file_.size();
    std::string fragment = unterminated_tail(size);

    TailExtractor extractor(std::move(file_), opt_);
    auto lines = extractor.extract(static_cast<long long>(capacity_), size - fragment.size());
    file_      = extractor.release();
    cursor_    = size;
    last_size_ = size;

    splitter_.reset();
    splitter_.carry(fragment);
    if (!fragment.empty())
        SPDLOG_DEBUG("FollowEngine: {} ends with {} unterminated byte(s)", path_, fragment.size());

    window_.clear();
    for (auto& line : lines)
        push_line(std::move(line), emit);
}

std::string FollowEngine::unterminated_tail(std::uint64_t size) const
{
    ByteWindowReader reader(file_, opt_.windowSizeBytes);
    std::vector<std::string> pieces;
    std::uint64_t cursor = size;
    while (cursor > 0) {
        Window w = reader.read_backward(cursor);
        auto nl = w.bytes.rfind('\n');
        if (nl != std::string::npos) {
            pieces.push_back(w.bytes.substr(nl + 1));
            break;
        }
        cursor = w.cursor;
        pieces.push_back(std::move(w.bytes));
    }

    std::string fragment;
    for (auto it = pieces.rbegin(); it != pieces.rend(); ++it)
        fragment += *it;
    return fragment;
}

void FollowEngine::push_line(std::string line, bool emit)
{
    if (emit) {
        ++emitted_;
        if (on_line_)
            on_line_(line);
    }
    if (capacity_ == 0)
        return;
    window_.push_back(std::move(line));
    if (window_.size() > capacity_)
        window_.pop_front();
}

void FollowEngine::on_recovery_pending(const TailError& e)
{
    ++pending_polls_;
    if (opt_.maxRotationRetries > 0 && pending_polls_ > opt_.maxRotationRetries) {
        spdlog::error("FollowEngine: {} still unavailable after {} poll(s), giving up",
                      path_, opt_.maxRotationRetries);
        state_ = FollowState::Stopped;
        throw TailError(ErrorKind::RotationRecoveryPending,
                        fmt::format("{} did not come back after {} poll(s): {}",
                                    path_, opt_.maxRotationRetries, e.what()));
    }
    spdlog::warn("FollowEngine: {} (attempt {}), retrying on next poll", e.what(), pending_polls_);
}

} // namespace backtail
