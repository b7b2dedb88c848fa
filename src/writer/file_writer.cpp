#include "writer/file_writer.hpp"

#include <cstdio>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "common/tail_error.hpp"

namespace backtail {

FileWriter::FileWriter(const std::string& path, std::size_t buf_capacity)
    : base_writer("file:" + path, buf_capacity), path_(path)
{
    ofs_.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!ofs_.is_open())
        throw TailError(ErrorKind::IOFailure, "FileWriter: cannot open " + path_ + " for append");
    spdlog::debug("FileWriter: appending to {}", path_);
}

FileWriter::~FileWriter() { flush_on_destroy(); }

void FileWriter::flush_impl(const std::vector<std::string>& batch)
{
    for (const auto& line : batch) {
        ofs_ << line << '\n';
    }
    ofs_.flush();          // 强制落盘
    if (!ofs_)
        throw TailError(ErrorKind::IOFailure, "FileWriter: write to " + path_ + " failed");
}

StdoutWriter::StdoutWriter(std::size_t buf_capacity)
    : base_writer("stdout", buf_capacity) {}

StdoutWriter::~StdoutWriter() { flush_on_destroy(); }

void StdoutWriter::flush_impl(const std::vector<std::string>& batch)
{
    for (const auto& line : batch) {
        fmt::print(stdout, "{}\n", line);
    }
    if (std::fflush(stdout) != 0)
        throw TailError(ErrorKind::IOFailure, "StdoutWriter: write to stdout failed");
}

std::unique_ptr<base_writer> make_writer(const std::string& output, std::size_t buf_capacity)
{
    if (output.empty() || output == "-")
        return std::make_unique<StdoutWriter>(buf_capacity);
    return std::make_unique<FileWriter>(output, buf_capacity);
}

} // namespace backtail
