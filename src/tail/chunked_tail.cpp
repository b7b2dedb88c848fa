#include "tail/chunked_tail.hpp"

#include <utility>

#include "reader/file_handle.hpp"
#include "tail/follow_engine.hpp"
#include "tail/tail_extractor.hpp"

namespace backtail {

ChunkedTail::ChunkedTail(TailOptions opt, std::shared_ptr<Sleeper> sleeper)
    : opt_(std::move(opt)), sleeper_(std::move(sleeper))
{
    opt_.validate();
}

std::vector<std::string> ChunkedTail::tail(const std::string& path, long long n)
{
    TailExtractor extractor(FileHandle::open(path), opt_);
    return extractor.extract(n);
}

void ChunkedTail::follow(const std::string& path, long long n,
                         LineCallback on_line, CancellationToken& token)
{
    FollowEngine engine(path, n, opt_, std::move(on_line), sleeper_);
    engine.run(token);
}

} // namespace backtail
