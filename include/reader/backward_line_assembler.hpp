#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/tail_options.hpp"
#include "reader/line_decoder.hpp"

namespace backtail {

/*==========================================================
 * 逆序行拼装
 *
 * 窗口按“从文件尾到文件头”的顺序喂进来，每个窗口内部也从
 * 最后一个字节往前扫。遇到 \n 时，之前攒下的字节就是一整行
 * （逆序存放），翻转后整体解码，所以跨窗口的多字节字符不会
 * 被切开。文件最后一个字节如果是 \n，它只是结尾符，不产生空行。
 *=========================================================*/
class BackwardLineAssembler {
public:
    // limit: 收集到这么多行（经过 filter）就停；file_size 用来识别结尾的 \n
    BackwardLineAssembler(const TailOptions& opt, std::size_t limit, std::uint64_t file_size);

    // window_start 是该窗口在文件中的起始偏移
    void feed(std::string_view window, std::uint64_t window_start);

    // 已到文件头：把剩下的片段作为第一行吐出（文件非空时）
    void finish();

    bool saturated() const noexcept { return lines_.size() >= limit_; }

    // 按发现顺序（即逆序）排列的行，取走后内部清空
    std::vector<std::string> take_lines() { return std::move(lines_); }

    std::size_t malformed_lines() const noexcept { return decoder_.malformed_lines(); }

private:
    void complete_line();

    TailOptions              opt_;
    std::size_t              limit_;
    std::uint64_t            file_size_;
    LineDecoder              decoder_;
    std::string              pending_rev_;   // 当前未结束的行，逆序
    std::vector<std::string> lines_;
};

} // namespace backtail
