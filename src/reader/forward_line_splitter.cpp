#include "reader/forward_line_splitter.hpp"

#include <utility>

namespace backtail {

ForwardLineSplitter::ForwardLineSplitter(const TailOptions& opt)
    : opt_(opt), decoder_(opt)
{
}

std::vector<std::string> ForwardLineSplitter::feed(std::string_view bytes)
{
    std::vector<std::string> out;
    feed(bytes, [&out](std::string line) { out.push_back(std::move(line)); });
    return out;
}

void ForwardLineSplitter::feed(std::string_view bytes,
                               const std::function<void(std::string)>& sink)
{
    for (;;) {
        auto pos = bytes.find('\n');
        if (pos == std::string_view::npos)
            break;

        std::string_view line;
        if (pending_.empty()) {
            line = bytes.substr(0, pos);
        } else {
            pending_.append(bytes.data(), pos);
            line = pending_;
        }

        std::string text = decoder_.decode(strip_terminator(line, opt_.lineTerminator));
        pending_.clear();
        bytes.remove_prefix(pos + 1);

        if (opt_.accepts(text))
            sink(std::move(text));
    }
    pending_.append(bytes.data(), bytes.size());
}

} // namespace backtail
