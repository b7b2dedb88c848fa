#include "tail/tail_extractor.hpp"

#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

#include "reader/backward_line_assembler.hpp"
#include "reader/byte_window_reader.hpp"

namespace backtail {

TailExtractor::TailExtractor(FileHandle file, const TailOptions& opt)
    : file_(std::move(file)), opt_(opt)
{
    opt_.validate();
}

std::vector<std::string> TailExtractor::extract(long long n)
{
    return extract(n, file_.size());
}

std::vector<std::string> TailExtractor::extract(long long n, std::uint64_t end)
{
    bytes_read_   = 0;
    scanned_size_ = std::min(end, file_.size());
    if (n <= 0)
        return {};

    ByteWindowReader reader(file_, opt_.windowSizeBytes);
    BackwardLineAssembler assembler(opt_, static_cast<std::size_t>(n), scanned_size_);

    std::uint64_t cursor = scanned_size_;
    while (cursor > 0 && !assembler.saturated()) {
        Window w = reader.read_backward(cursor);
        assembler.feed(w.bytes, w.cursor);
        bytes_read_ += w.bytes.size();
        cursor = w.cursor;
    }
    if (cursor == 0)
        assembler.finish();

    auto lines = assembler.take_lines();
    std::reverse(lines.begin(), lines.end());

    if (assembler.malformed_lines() > 0) {
        spdlog::warn("TailExtractor: {} line(s) of {} contained malformed {} sequences",
                     assembler.malformed_lines(), file_.path(), to_string(opt_.encoding));
    }
    SPDLOG_DEBUG("TailExtractor: {} lines from {} ({} of {} bytes read)",
                 lines.size(), file_.path(), bytes_read_, scanned_size_);
    return lines;
}

} // namespace backtail
