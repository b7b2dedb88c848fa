#pragma once

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtail::test {

namespace fs = std::filesystem;

// 每个用例一个临时目录，析构时删掉
class TempDir {
public:
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "backtail-XXXXXX").string();
        if (::mkdtemp(tmpl.data()) == nullptr)
            throw std::runtime_error("mkdtemp failed");
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline void append_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    ofs << content;
}

// 参照实现：正向 getline 解析整个文件
inline std::vector<std::string> getline_oracle(const std::string& content, bool strip_cr = true) {
    std::vector<std::string> out;
    std::istringstream is(content);
    std::string line;
    while (std::getline(is, line)) {
        if (strip_cr && !line.empty() && line.back() == '\r')
            line.pop_back();
        out.push_back(line);
    }
    return out;
}

inline std::vector<std::string> last_n(const std::vector<std::string>& all, std::size_t n) {
    if (n >= all.size())
        return all;
    return {all.end() - static_cast<std::ptrdiff_t>(n), all.end()};
}

} // namespace backtail::test
