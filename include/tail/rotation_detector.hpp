#pragma once

#include <cstdint>
#include <string>

#include "reader/file_handle.hpp"

namespace backtail {

enum class RotationState {
    Unchanged,   // 包括单纯的增长
    Truncated,   // 同一个文件，变短了
    Replaced     // 路径指向了另一个文件（删了重建 / 改名后重建）
};

const char* to_string(RotationState s);

struct RotationCheck {
    RotationState state = RotationState::Unchanged;
    FileIdentity  current;
};

class RotationDetector {
public:
    // 路径不存在时抛 TailError(RotationRecoveryPending)，无权限抛 PermissionDenied
    static RotationCheck detect(const FileIdentity& previous,
                                std::uint64_t previous_size,
                                const std::string& path);

    // stat 路径（不打开）
    static FileIdentity stat_path(const std::string& path);
};

} // namespace backtail
