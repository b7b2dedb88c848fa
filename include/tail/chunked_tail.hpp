#pragma once

#include <memory>
#include <string>
#include <vector>

#include "common/tail_options.hpp"
#include "tail/itail.h"

namespace backtail {

// 逆序分块读取的 tail 实现，follow 交给 FollowEngine
class ChunkedTail : public ITail {
public:
    explicit ChunkedTail(TailOptions opt, std::shared_ptr<Sleeper> sleeper = nullptr);

    std::vector<std::string> tail(const std::string& path, long long n) override;

    void follow(const std::string& path, long long n,
                LineCallback on_line, CancellationToken& token) override;

    const TailOptions& options() const noexcept { return opt_; }

private:
    TailOptions              opt_;
    std::shared_ptr<Sleeper> sleeper_;
};

} // namespace backtail
