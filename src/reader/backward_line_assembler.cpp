#include "reader/backward_line_assembler.hpp"

#include <cstddef>
#include <spdlog/spdlog.h>

namespace backtail {

BackwardLineAssembler::BackwardLineAssembler(const TailOptions& opt,
                                             std::size_t limit,
                                             std::uint64_t file_size)
    : opt_(opt),
      limit_(limit),
      file_size_(file_size),
      decoder_(opt)
{
}

void BackwardLineAssembler::feed(std::string_view window, std::uint64_t window_start)
{
    std::size_t end = window.size();   // [0, end) 还没扫
    while (end > 0 && !saturated()) {
        std::size_t nl = window.rfind('\n', end - 1);
        std::size_t seg_begin = (nl == std::string_view::npos) ? 0 : nl + 1;

        // [seg_begin, end) 逆序追加
        pending_rev_.append(window.rbegin() + static_cast<std::ptrdiff_t>(window.size() - end),
                            window.rbegin() + static_cast<std::ptrdiff_t>(window.size() - seg_begin));
        if (nl == std::string_view::npos)
            break;

        if (window_start + nl + 1 != file_size_)
            complete_line();
        end = nl;
    }
}

void BackwardLineAssembler::finish()
{
    if (file_size_ > 0 && !saturated())
        complete_line();
    if (!pending_rev_.empty()) {
        SPDLOG_TRACE("BackwardLineAssembler: dropping {} pending bytes after saturation",
                     pending_rev_.size());
        pending_rev_.clear();
    }
}

void BackwardLineAssembler::complete_line()
{
    std::string forward(pending_rev_.rbegin(), pending_rev_.rend());
    pending_rev_.clear();

    std::string text = decoder_.decode(strip_terminator(forward, opt_.lineTerminator));
    if (!opt_.accepts(text))
        return;
    lines_.push_back(std::move(text));
}

} // namespace backtail
