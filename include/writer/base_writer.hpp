#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace backtail {

// 输出端基类：攒满一批（或显式 flush）时同步交给 flush_impl。
// 批大小有上限，写满时调用方阻塞在 flush 上，不引入无界队列。
class base_writer
{
public:
    explicit base_writer(std::string name, std::size_t buf_capacity = 64);
    virtual ~base_writer();

    base_writer(const base_writer&)            = delete;
    base_writer& operator=(const base_writer&) = delete;

    void write(const std::string& line);
    void flush();

    const std::string& name() const noexcept { return name_; }
    std::size_t lines_written() const noexcept { return lines_written_; }

protected:
    virtual void flush_impl(const std::vector<std::string>& batch) = 0;

    // 派生类析构前调用，保证最后一批写出去
    void flush_on_destroy() noexcept;

    std::string name_;

private:
    struct Buffer;

    const std::size_t       buf_capacity_;
    std::unique_ptr<Buffer> front_;
    std::size_t             lines_written_ = 0;
};

} // namespace backtail
