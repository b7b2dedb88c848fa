#include "reader/byte_window_reader.hpp"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace backtail {

ByteWindowReader::ByteWindowReader(const FileHandle& file, std::size_t window_size)
    : file_(file), window_size_(window_size)
{
    if (window_size_ == 0)
        throw std::invalid_argument("ByteWindowReader: window size must be positive");
}

Window ByteWindowReader::read_backward(std::uint64_t cursor) const
{
    std::uint64_t start = cursor > window_size_ ? cursor - window_size_ : 0;
    Window w;
    w.bytes.resize(static_cast<std::size_t>(cursor - start));
    if (!w.bytes.empty())
        file_.read_at(start, w.bytes.data(), w.bytes.size());
    w.cursor = start;
    SPDLOG_TRACE("ByteWindowReader: backward [{}, {}) of {}", start, cursor, file_.path());
    return w;
}

Window ByteWindowReader::read_forward(std::uint64_t cursor, std::uint64_t end) const
{
    std::uint64_t stop = std::min<std::uint64_t>(end, cursor + window_size_);
    Window w;
    if (stop <= cursor) {
        w.cursor = cursor;
        return w;
    }
    w.bytes.resize(static_cast<std::size_t>(stop - cursor));
    file_.read_at(cursor, w.bytes.data(), w.bytes.size());
    w.cursor = stop;
    SPDLOG_TRACE("ByteWindowReader: forward [{}, {}) of {}", cursor, stop, file_.path());
    return w;
}

} // namespace backtail
