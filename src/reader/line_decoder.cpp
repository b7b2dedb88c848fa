#include "reader/line_decoder.hpp"

#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "common/tail_error.hpp"

namespace backtail {

namespace {

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// 返回从 i 开始的合法 UTF-8 序列长度；非法时返回 0，并把 consumed 设为最长非法前缀长度（至少 1）
std::size_t utf8_sequence(std::string_view s, std::size_t i, std::size_t& consumed)
{
    auto c = static_cast<unsigned char>(s[i]);
    consumed = 1;
    if (c < 0x80)
        return 1;

    std::size_t len;
    unsigned char lo = 0x80, hi = 0xBF;   // 第二个字节的合法区间
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) lo = 0xA0;          // 过长编码
        if (c == 0xED) hi = 0x9F;          // 代理区
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;          // > U+10FFFF
    } else {
        return 0;
    }

    for (std::size_t k = 1; k < len; ++k) {
        if (i + k >= s.size())
            return 0;
        auto b = static_cast<unsigned char>(s[i + k]);
        if (k == 1 ? (b < lo || b > hi) : !is_continuation(b))
            return 0;
        consumed = k + 1;
    }
    return len;
}

} // namespace

LineDecoder::LineDecoder(Encoding encoding, MalformedPolicy policy, std::string replacement)
    : encoding_(encoding), policy_(policy), replacement_(std::move(replacement)) {}

std::string LineDecoder::decode(std::string_view bytes)
{
    std::string out;
    out.reserve(bytes.size());

    bool clean = true;
    switch (encoding_) {
    case Encoding::Utf8:   clean = decode_utf8(bytes, out);  break;
    case Encoding::Ascii:  clean = decode_ascii(bytes, out); break;
    case Encoding::Latin1: decode_latin1(bytes, out);        break;
    }

    if (!clean) {
        if (policy_ == MalformedPolicy::FailFast) {
            throw TailError(ErrorKind::DecodeFailure,
                            fmt::format("malformed {} sequence in line of {} bytes",
                                        to_string(encoding_), bytes.size()));
        }
        ++malformed_lines_;
        SPDLOG_DEBUG("LineDecoder: substituted malformed {} bytes in line of {} bytes",
                     to_string(encoding_), bytes.size());
    }
    return out;
}

bool LineDecoder::decode_utf8(std::string_view bytes, std::string& out) const
{
    bool clean = true;
    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t consumed = 0;
        std::size_t len = utf8_sequence(bytes, i, consumed);
        if (len == 0) {
            clean = false;
            if (policy_ == MalformedPolicy::FailFast)
                return false;
            out += replacement_;
            i += consumed;
            continue;
        }
        out.append(bytes.data() + i, len);
        i += len;
    }
    return clean;
}

bool LineDecoder::decode_ascii(std::string_view bytes, std::string& out) const
{
    bool clean = true;
    for (char ch : bytes) {
        if (static_cast<unsigned char>(ch) >= 0x80) {
            clean = false;
            if (policy_ == MalformedPolicy::FailFast)
                return false;
            out += replacement_;
        } else {
            out.push_back(ch);
        }
    }
    return clean;
}

void LineDecoder::decode_latin1(std::string_view bytes, std::string& out) const
{
    // ISO-8859-1 每个字节都对应 U+0000..U+00FF，不会失败
    for (char ch : bytes) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(ch);
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
}

} // namespace backtail
