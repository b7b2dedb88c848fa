#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "common/tail_options.hpp"
#include "reader/line_decoder.hpp"

namespace backtail {

// follow 模式的正向切行：不完整的尾巴留到下一次 poll
class ForwardLineSplitter {
public:
    explicit ForwardLineSplitter(const TailOptions& opt);

    // 追加一段字节，返回其中新完成的行（已解码、已过滤）
    std::vector<std::string> feed(std::string_view bytes);

    // 同上，但每完成一行立即交给 sink；解码失败抛出时，之前的行已经交出去了
    void feed(std::string_view bytes, const std::function<void(std::string)>& sink);

    // 预置未完成的尾巴（seed 时文件末尾没有换行的那一段原始字节）
    void carry(std::string_view bytes) { pending_.append(bytes.data(), bytes.size()); }

    // 轮转时丢弃未完成的尾巴
    void reset() { pending_.clear(); }

    std::size_t pending_bytes() const noexcept { return pending_.size(); }

private:
    TailOptions opt_;
    LineDecoder decoder_;
    std::string pending_;
};

} // namespace backtail
