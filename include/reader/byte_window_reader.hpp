#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "reader/file_handle.hpp"

namespace backtail {

// 一次读取的字节块；只在处理这一块期间存活
struct Window {
    std::string   bytes;
    std::uint64_t cursor = 0;   // 读完之后的游标
};

class ByteWindowReader {
public:
    ByteWindowReader(const FileHandle& file, std::size_t window_size);

    // start = max(0, cursor - window)，读 [start, cursor)，返回游标 start
    Window read_backward(std::uint64_t cursor) const;

    // 读 [cursor, min(cursor + window, end))，返回新游标
    Window read_forward(std::uint64_t cursor, std::uint64_t end) const;

    std::size_t window_size() const noexcept { return window_size_; }

private:
    const FileHandle& file_;
    std::size_t       window_size_;
};

} // namespace backtail
