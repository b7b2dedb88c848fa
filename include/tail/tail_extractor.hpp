#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "common/tail_options.hpp"
#include "reader/file_handle.hpp"

namespace backtail {

// 独占一个文件句柄，从文件尾往前按窗口读，收集最后 n 行。
// 用完后可以通过 release() 把句柄交给 FollowEngine。
class TailExtractor {
public:
    TailExtractor(FileHandle file, const TailOptions& opt);

    // 最多 n 行，按文件原顺序；n <= 0 返回空
    std::vector<std::string> extract(long long n);

    // 只看 [0, end) 的内容；end 超过当前文件大小时按文件大小算
    std::vector<std::string> extract(long long n, std::uint64_t end);

    // 最近一次 extract 所基于的文件大小，follow 从这里接着读
    std::uint64_t scanned_size() const noexcept { return scanned_size_; }

    // 本次读过的字节数
    std::uint64_t bytes_read() const noexcept { return bytes_read_; }

    FileHandle release() { return std::move(file_); }

private:
    FileHandle    file_;
    TailOptions   opt_;
    std::uint64_t scanned_size_ = 0;
    std::uint64_t bytes_read_   = 0;
};

} // namespace backtail
