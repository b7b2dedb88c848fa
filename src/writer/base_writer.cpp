#include "writer/base_writer.hpp"

#include <exception>
#include <utility>
#include <spdlog/spdlog.h>

namespace backtail {

// 内部类型完整定义
struct base_writer::Buffer
{
    explicit Buffer(std::size_t reserve) { vec.reserve(reserve); }
    void push_back(const std::string& line) { vec.push_back(line); }
    void clear() { vec.clear(); }
    std::size_t size() const { return vec.size(); }
    std::vector<std::string> vec;
};

// -------------------- 构造 / 析构 --------------------
base_writer::base_writer(std::string name, std::size_t buf_capacity)
    : name_(std::move(name)),
      buf_capacity_(buf_capacity == 0 ? 1 : buf_capacity),
      front_(std::make_unique<Buffer>(buf_capacity_))
{
}

base_writer::~base_writer() = default;

// -------------------- 公有接口 --------------------
void base_writer::write(const std::string& line)
{
    front_->push_back(line);
    if (front_->size() >= buf_capacity_)
        flush();
}

void base_writer::flush()
{
    if (front_->vec.empty())
        return;
    flush_impl(front_->vec);
    lines_written_ += front_->size();
    front_->clear();
}

// -------------------- 保护 / 私有实现 --------------------
void base_writer::flush_on_destroy() noexcept
{
    try {
        flush();
    } catch (const std::exception& e) {
        spdlog::error("base_writer: '{}' lost {} line(s) on shutdown: {}",
                      name_, front_->size(), e.what());
    }
}

} // namespace backtail
