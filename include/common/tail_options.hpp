#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "common/config.hpp"

namespace backtail {

enum class LineTerminator {
    Lf,             // 只认 \n，\r 保留在行内
    LfOptionalCr    // \n 前紧邻的 \r 一并剥掉
};

enum class MalformedPolicy {
    Substitute,     // 非法序列替换为 replacement，继续
    FailFast        // 抛 TailError(DecodeFailure)
};

enum class Encoding {
    Utf8,
    Ascii,
    Latin1
};

enum class ReopenFrom {
    Start,          // 轮转后从新文件开头读并输出
    End             // 轮转后静默重新 seed，只输出之后追加的内容
};

struct TailOptions {
    std::size_t               windowSizeBytes    = 8192;
    std::chrono::milliseconds pollInterval       {500};
    LineTerminator            lineTerminator     = LineTerminator::LfOptionalCr;
    MalformedPolicy           malformedPolicy    = MalformedPolicy::Substitute;
    std::string               replacement        = "\xEF\xBF\xBD";   // U+FFFD
    Encoding                  encoding           = Encoding::Utf8;
    ReopenFrom                reopenFrom         = ReopenFrom::Start;
    unsigned                  maxRotationRetries = 0;                // 0 = 不限
    std::string               filter;                                // 空 = 不过滤

    // 读取 [tail] 段，未出现的键保留默认值
    static TailOptions fromConfig(const Config& config);

    // 非法取值抛 std::invalid_argument
    void validate() const;

    bool accepts(const std::string& line) const {
        return filter.empty() || line.find(filter) != std::string::npos;
    }
};

LineTerminator parseLineTerminator(const std::string& s);
MalformedPolicy parseMalformedPolicy(const std::string& s);
Encoding parseEncoding(const std::string& s);
ReopenFrom parseReopenFrom(const std::string& s);

const char* to_string(Encoding e);

} // namespace backtail
