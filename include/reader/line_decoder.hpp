#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "common/tail_options.hpp"

namespace backtail {

// LfOptionalCr 策略下去掉行尾的 \r
inline std::string_view strip_terminator(std::string_view line, LineTerminator policy)
{
    if (policy == LineTerminator::LfOptionalCr && !line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

// 把一整行的原始字节按声明编码解码成 UTF-8 文本。
// 调用方必须传入完整的一行，不能传跨窗口的碎片。
class LineDecoder {
public:
    LineDecoder(Encoding encoding, MalformedPolicy policy, std::string replacement);
    explicit LineDecoder(const TailOptions& opt)
        : LineDecoder(opt.encoding, opt.malformedPolicy, opt.replacement) {}

    // FailFast 策略下遇到非法序列抛 TailError(DecodeFailure)
    std::string decode(std::string_view bytes);

    // 含非法序列的行数（Substitute 策略下被替换过的行）
    std::size_t malformed_lines() const noexcept { return malformed_lines_; }

private:
    bool decode_utf8(std::string_view bytes, std::string& out) const;
    bool decode_ascii(std::string_view bytes, std::string& out) const;
    void decode_latin1(std::string_view bytes, std::string& out) const;

    Encoding        encoding_;
    MalformedPolicy policy_;
    std::string     replacement_;
    std::size_t     malformed_lines_ = 0;
};

} // namespace backtail
