// itail.h
#pragma once
#include <functional>
#include <string>
#include <vector>

#include "common/cancellation.hpp"

namespace backtail {

// 每完成一行调用一次；同步调用，慢的消费者会阻塞 follow 循环
using LineCallback = std::function<void(const std::string& line)>;

class ITail {
public:
    virtual ~ITail() = default;

    // 最后 n 行，按文件顺序；失败抛 TailError
    virtual std::vector<std::string> tail(const std::string& path, long long n) = 0;

    // 先输出最后 n 行，再持续输出新追加的行，直到 token 被取消或遇到不可恢复的错误
    virtual void follow(const std::string& path, long long n,
                        LineCallback on_line, CancellationToken& token) = 0;
};

} // namespace backtail
