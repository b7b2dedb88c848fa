#include "common/tail_options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/core.h>

namespace backtail {

namespace {

const char* kSection = "tail";

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

LineTerminator parseLineTerminator(const std::string& s)
{
    auto v = lower(s);
    if (v == "lf") return LineTerminator::Lf;
    if (v == "lf_optional_cr" || v == "crlf") return LineTerminator::LfOptionalCr;
    throw std::invalid_argument(fmt::format("unknown line_terminator '{}'", s));
}

MalformedPolicy parseMalformedPolicy(const std::string& s)
{
    auto v = lower(s);
    if (v == "substitute") return MalformedPolicy::Substitute;
    if (v == "fail_fast") return MalformedPolicy::FailFast;
    throw std::invalid_argument(fmt::format("unknown malformed_line policy '{}'", s));
}

Encoding parseEncoding(const std::string& s)
{
    auto v = lower(s);
    if (v == "utf-8" || v == "utf8") return Encoding::Utf8;
    if (v == "us-ascii" || v == "ascii") return Encoding::Ascii;
    if (v == "iso-8859-1" || v == "latin1" || v == "latin-1") return Encoding::Latin1;
    throw std::invalid_argument(fmt::format("unsupported encoding '{}'", s));
}

ReopenFrom parseReopenFrom(const std::string& s)
{
    auto v = lower(s);
    if (v == "start") return ReopenFrom::Start;
    if (v == "end") return ReopenFrom::End;
    throw std::invalid_argument(fmt::format("unknown reopen_from '{}'", s));
}

const char* to_string(Encoding e)
{
    switch (e) {
    case Encoding::Utf8:   return "utf-8";
    case Encoding::Ascii:  return "us-ascii";
    case Encoding::Latin1: return "iso-8859-1";
    }
    return "unknown";
}

TailOptions TailOptions::fromConfig(const Config& config)
{
    TailOptions opt;

    auto window = config.getOr<long long>(kSection, "window_size_bytes",
                                          static_cast<long long>(opt.windowSizeBytes));
    if (window <= 0)
        throw std::invalid_argument("window_size_bytes must be positive");
    opt.windowSizeBytes = static_cast<std::size_t>(window);

    auto poll = config.getOr<long long>(kSection, "poll_interval_ms", opt.pollInterval.count());
    if (poll <= 0)
        throw std::invalid_argument("poll_interval_ms must be positive");
    opt.pollInterval = std::chrono::milliseconds(poll);

    if (config.has(kSection, "line_terminator"))
        opt.lineTerminator = parseLineTerminator(config.getString(kSection, "line_terminator"));
    if (config.has(kSection, "malformed_line"))
        opt.malformedPolicy = parseMalformedPolicy(config.getString(kSection, "malformed_line"));
    if (config.has(kSection, "encoding"))
        opt.encoding = parseEncoding(config.getString(kSection, "encoding"));
    if (config.has(kSection, "reopen_from"))
        opt.reopenFrom = parseReopenFrom(config.getString(kSection, "reopen_from"));

    opt.replacement = config.getOr<std::string>(kSection, "replacement", opt.replacement);
    opt.filter = config.getOr<std::string>(kSection, "filter", opt.filter);

    auto retries = config.getOr<long long>(kSection, "max_rotation_retries", 0);
    if (retries < 0)
        throw std::invalid_argument("max_rotation_retries must not be negative");
    opt.maxRotationRetries = static_cast<unsigned>(retries);

    opt.validate();
    return opt;
}

void TailOptions::validate() const
{
    if (windowSizeBytes == 0)
        throw std::invalid_argument("window size must be positive");
    if (pollInterval.count() <= 0)
        throw std::invalid_argument("poll interval must be positive");
}

} // namespace backtail
