#include "tail/rotation_detector.hpp"

#include <sys/stat.h>
#include <cerrno>
#include <spdlog/spdlog.h>

#include "common/tail_error.hpp"

namespace backtail {

const char* to_string(RotationState s)
{
    switch (s) {
    case RotationState::Unchanged: return "unchanged";
    case RotationState::Truncated: return "truncated";
    case RotationState::Replaced:  return "replaced";
    }
    return "unknown";
}

FileIdentity RotationDetector::stat_path(const std::string& path)
{
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        auto err = TailError::from_errno(errno, "stat", path);
        if (err.kind() == ErrorKind::FileNotFound)
            throw TailError(ErrorKind::RotationRecoveryPending, err.what());
        throw err;
    }
    return {static_cast<std::uint64_t>(st.st_dev),
            static_cast<std::uint64_t>(st.st_ino),
            static_cast<std::uint64_t>(st.st_size)};
}

RotationCheck RotationDetector::detect(const FileIdentity& previous,
                                       std::uint64_t previous_size,
                                       const std::string& path)
{
    RotationCheck check;
    check.current = stat_path(path);

    if (!check.current.same_file(previous)) {
        check.state = RotationState::Replaced;
    } else if (check.current.size < previous_size) {
        check.state = RotationState::Truncated;
    }
    SPDLOG_TRACE("RotationDetector: {} ino {} size {} -> ino {} size {}: {}",
                 path, previous.inode, previous_size,
                 check.current.inode, check.current.size, to_string(check.state));
    return check;
}

} // namespace backtail
