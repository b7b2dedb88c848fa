#include "reader/file_handle.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "common/tail_error.hpp"

namespace backtail {

FileHandle::~FileHandle() { close(); }

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept
{
    if (this != &other) {
        close();
        fd_   = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

FileHandle FileHandle::open(const std::string& path)
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
        throw TailError::from_errno(errno, "open", path);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw TailError::from_errno(err, "fstat", path);
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        throw TailError(ErrorKind::IOFailure, fmt::format("open {}: is a directory", path));
    }
    SPDLOG_DEBUG("FileHandle: opened {} (fd {}, {} bytes)", path, fd, st.st_size);
    return FileHandle(fd, path);
}

FileIdentity FileHandle::identity() const
{
    struct stat st{};
    if (::fstat(fd_, &st) != 0)
        throw TailError::from_errno(errno, "fstat", path_);
    return {static_cast<std::uint64_t>(st.st_dev),
            static_cast<std::uint64_t>(st.st_ino),
            static_cast<std::uint64_t>(st.st_size)};
}

void FileHandle::read_at(std::uint64_t offset, char* buf, std::size_t len) const
{
    std::size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TailError(ErrorKind::IOFailure,
                            fmt::format("pread {} at {}: {}", path_, offset + done, std::strerror(errno)));
        }
        if (n == 0) {
            // 读到一半文件变短了
            throw TailError(ErrorKind::IOFailure,
                            fmt::format("pread {}: unexpected end of file at {} (wanted {} bytes from {})",
                                        path_, offset + done, len, offset));
        }
        done += static_cast<std::size_t>(n);
    }
}

void FileHandle::close() noexcept
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace backtail
