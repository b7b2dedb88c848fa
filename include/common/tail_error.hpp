#pragma once

#include <stdexcept>
#include <string>

namespace backtail {

enum class ErrorKind {
    FileNotFound,
    PermissionDenied,
    IOFailure,                  // 读 / seek / stat 失败
    DecodeFailure,              // 仅作用于单行
    RotationRecoveryPending     // 轮转窗口内路径暂不可读，可重试
};

const char* to_string(ErrorKind kind);

class TailError : public std::runtime_error {
public:
    TailError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    // 按 errno 归类：ENOENT/ENOTDIR -> FileNotFound，EACCES/EPERM -> PermissionDenied，其余 IOFailure
    static TailError from_errno(int err, const std::string& op, const std::string& path);

private:
    ErrorKind kind_;
};

} // namespace backtail
