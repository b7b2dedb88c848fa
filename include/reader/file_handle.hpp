#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace backtail {

// 文件身份：设备号 + inode，每个 poll 周期重新取
struct FileIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode  = 0;
    std::uint64_t size   = 0;

    bool same_file(const FileIdentity& other) const {
        return device == other.device && inode == other.inode;
    }
};

// 只读 fd 的 RAII 封装，只能移动不能拷贝
class FileHandle {
public:
    FileHandle() = default;
    ~FileHandle();

    FileHandle(const FileHandle&)            = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    // 失败抛 TailError(FileNotFound / PermissionDenied / IOFailure)
    static FileHandle open(const std::string& path);

    bool is_open() const noexcept { return fd_ >= 0; }
    const std::string& path() const noexcept { return path_; }

    // fstat 当前句柄
    FileIdentity identity() const;
    std::uint64_t size() const { return identity().size; }

    // 在 offset 处读满 len 字节到 buf；短读或出错抛 TailError(IOFailure)
    void read_at(std::uint64_t offset, char* buf, std::size_t len) const;

    void close() noexcept;

private:
    FileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int         fd_ = -1;
    std::string path_;
};

} // namespace backtail
