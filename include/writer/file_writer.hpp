#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "writer/base_writer.hpp"

namespace backtail {

// 追加写到文件，每批之后落盘
class FileWriter : public base_writer {
public:
    explicit FileWriter(const std::string& path, std::size_t buf_capacity = 64);
    ~FileWriter() override;

protected:
    void flush_impl(const std::vector<std::string>& batch) override;

private:
    std::string   path_;
    std::ofstream ofs_;
};

class StdoutWriter : public base_writer {
public:
    explicit StdoutWriter(std::size_t buf_capacity = 64);
    ~StdoutWriter() override;

protected:
    void flush_impl(const std::vector<std::string>& batch) override;
};

// "-" 或空串写 stdout，否则写文件
std::unique_ptr<base_writer> make_writer(const std::string& output, std::size_t buf_capacity = 64);

} // namespace backtail
