#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <optional>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/signal_watcher.hpp"
#include "common/tail_error.hpp"
#include "common/tail_options.hpp"
#include "tail/chunked_tail.hpp"
#include "writer/file_writer.hpp"

using namespace backtail;

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitTail  = 1;
constexpr int kExitUsage = 2;

// 日志走 stderr，stdout 只留给输出的行
void init_logging() {
    spdlog::set_default_logger(spdlog::stderr_color_mt("backtail"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

void apply_log_level(std::string log_level) {
    const static auto log_level_map = std::map<std::string, spdlog::level::level_enum>{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };
    auto it = log_level_map.find(log_level);
    if (it == log_level_map.end()) {
        log_level = "info"; // 默认 info 级别
    }
    spdlog::set_level(log_level_map.at(log_level));
}

TailOptions build_options(const cxxopts::ParseResult& result, const Config& config) {
    auto opt = TailOptions::fromConfig(config);
    if (result.count("encoding"))
        opt.encoding = parseEncoding(result["encoding"].as<std::string>());
    if (result.count("window-size"))
        opt.windowSizeBytes = result["window-size"].as<std::size_t>();
    if (result.count("sleep-interval"))
        opt.pollInterval = std::chrono::milliseconds(result["sleep-interval"].as<long long>());
    if (result.count("grep"))
        opt.filter = result["grep"].as<std::string>();
    if (result.count("strict"))
        opt.malformedPolicy = MalformedPolicy::FailFast;
    if (result.count("from-end"))
        opt.reopenFrom = ReopenFrom::End;
    if (result.count("max-retries"))
        opt.maxRotationRetries = result["max-retries"].as<unsigned>();
    opt.validate();
    return opt;
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("backtail", "Print the last lines of a file, optionally following it");
    options.add_options()
        ("h,help", "Show help")
        ("n,lines", "Number of lines to print", cxxopts::value<long long>()->default_value("10"))
        ("f,follow", "Keep printing lines as the file grows")
        ("c,config", "Configuration file path", cxxopts::value<std::string>())
        ("e,encoding", "File encoding (utf-8, us-ascii, iso-8859-1)", cxxopts::value<std::string>())
        ("w,window-size", "Read window size in bytes", cxxopts::value<std::size_t>())
        ("s,sleep-interval", "Follow poll interval in milliseconds", cxxopts::value<long long>())
        ("g,grep", "Only lines containing this text", cxxopts::value<std::string>())
        ("o,output", "Append lines to this file instead of stdout", cxxopts::value<std::string>()->default_value("-"))
        ("strict", "Fail on malformed byte sequences instead of substituting")
        ("from-end", "After rotation, skip the existing content of the new file")
        ("max-retries", "Give up after this many polls without the file (0 = never)", cxxopts::value<unsigned>())
        ("log-level", "trace, debug, info, warn, error, critical, off", cxxopts::value<std::string>())
        ("file", "File to read", cxxopts::value<std::string>());
    options.parse_positional({"file"});
    options.positional_help("FILE");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed = options.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "backtail: " << e.what() << "\n" << options.help() << std::endl;
        return kExitUsage;
    }
    auto& result = *parsed;
    if (result.count("help") || !result.count("file")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? kExitOk : kExitUsage;
    }

    init_logging();
    if (result.count("log-level"))
        apply_log_level(result["log-level"].as<std::string>());

    Config config;
    TailOptions tail_options;
    try {
        if (result.count("config"))
            config = Config(result["config"].as<std::string>());
        if (!result.count("log-level") && config.has("backtail", "log_level"))
            apply_log_level(config.getString("backtail", "log_level"));
        tail_options = build_options(result, config);
    } catch (const std::exception& e) {
        std::cerr << "backtail: " << e.what() << std::endl;
        return kExitUsage;
    }

    const auto path  = result["file"].as<std::string>();
    const auto lines = result["lines"].as<long long>();
    const bool follow = result.count("follow") > 0;

    CancellationToken token;
    std::optional<SignalWatcher> signals;
    if (follow)
        signals.emplace(token);

    try {
        auto writer = make_writer(result["output"].as<std::string>());
        ChunkedTail tail(tail_options);

        if (!follow) {
            for (const auto& line : tail.tail(path, lines))
                writer->write(line);
            writer->flush();
            return kExitOk;
        }

        // follow 时每行立即写出，避免攒批造成延迟
        tail.follow(path, lines,
                    [&writer](const std::string& line) {
                        writer->write(line);
                        writer->flush();
                    },
                    token);
        writer->flush();
    } catch (const TailError& e) {
        spdlog::error("Main: {} ({})", e.what(), to_string(e.kind()));
        return kExitTail;
    }
    return kExitOk;
}
