#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/tail_error.hpp"
#include "common/tail_options.hpp"
#include "reader/backward_line_assembler.hpp"
#include "reader/forward_line_splitter.hpp"
#include "reader/line_decoder.hpp"
#include "tail/chunked_tail.hpp"
#include "test_util.hpp"

using namespace backtail;
using namespace backtail::test;

namespace {
const std::string kFffd = "\xEF\xBF\xBD";
}

TEST(LineDecoderTest, ValidUtf8PassesThrough) {
    LineDecoder d(Encoding::Utf8, MalformedPolicy::FailFast, kFffd);
    const std::string s = "plain \xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80 text";
    EXPECT_EQ(d.decode(s), s);
    EXPECT_EQ(d.malformed_lines(), 0u);
}

TEST(LineDecoderTest, InvalidUtf8IsSubstituted) {
    LineDecoder d(Encoding::Utf8, MalformedPolicy::Substitute, kFffd);
    // 孤立的续字节
    EXPECT_EQ(d.decode("a\x80" "b"), "a" + kFffd + "b");
    // 截断的三字节序列只替换一次
    EXPECT_EQ(d.decode("a\xE2\x82"), "a" + kFffd);
    // 过长编码 C0 AF
    EXPECT_EQ(d.decode("\xC0\xAF"), kFffd + kFffd);
    // 代理区 ED A0 80
    EXPECT_EQ(d.decode("\xED\xA0\x80"), kFffd + kFffd + kFffd);
    EXPECT_EQ(d.malformed_lines(), 4u);
}

TEST(LineDecoderTest, CustomReplacementMarker) {
    LineDecoder d(Encoding::Utf8, MalformedPolicy::Substitute, "?");
    EXPECT_EQ(d.decode("x\xFFy"), "x?y");
}

TEST(LineDecoderTest, FailFastThrowsDecodeFailure) {
    LineDecoder d(Encoding::Utf8, MalformedPolicy::FailFast, kFffd);
    try {
        d.decode("bad \xFF byte");
        FAIL() << "expected TailError";
    } catch (const TailError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DecodeFailure);
    }
}

TEST(LineDecoderTest, AsciiRejectsHighBytes) {
    LineDecoder d(Encoding::Ascii, MalformedPolicy::Substitute, "?");
    EXPECT_EQ(d.decode("abc"), "abc");
    EXPECT_EQ(d.decode("a\xC3\xA9"), "a??");
}

TEST(LineDecoderTest, Latin1IsTranscodedToUtf8) {
    LineDecoder d(Encoding::Latin1, MalformedPolicy::FailFast, kFffd);
    EXPECT_EQ(d.decode("caf\xE9"), "caf\xC3\xA9");
    EXPECT_EQ(d.decode("\xFF"), "\xC3\xBF");
}

TEST(BackwardLineAssemblerTest, FragmentsAcrossWindowsAreJoined) {
    TailOptions opt;
    // 文件内容 "ab\ncd\nef"，按窗口 3 逆序喂入
    BackwardLineAssembler assembler(opt, 10, 8);
    assembler.feed("\nef", 5);
    assembler.feed("b\ncd", 1);
    assembler.feed("a", 0);
    assembler.finish();
    auto lines = assembler.take_lines();
    EXPECT_EQ(lines, (std::vector<std::string>{"ef", "cd", "ab"}));
}

TEST(BackwardLineAssemblerTest, StopsWhenLimitReached) {
    TailOptions opt;
    BackwardLineAssembler assembler(opt, 2, 9);
    assembler.feed("a\nb\nc\nd\n", 1);
    EXPECT_TRUE(assembler.saturated());
    auto lines = assembler.take_lines();
    EXPECT_EQ(lines, (std::vector<std::string>{"d", "c"}));
}

TEST(BackwardLineAssemblerTest, MalformedLineIsSubstitutedNotFatal) {
    TempDir dir;
    auto path = dir.file("mixed.txt");
    write_file(path, "good\nbad \xFF\nalso good\n");

    TailOptions opt;
    opt.windowSizeBytes = 4;
    auto lines = ChunkedTail(opt).tail(path, 10);
    EXPECT_EQ(lines, (std::vector<std::string>{"good", "bad " + kFffd, "also good"}));
}

TEST(BackwardLineAssemblerTest, FailFastAbortsExtraction) {
    TempDir dir;
    auto path = dir.file("mixed.txt");
    write_file(path, "good\nbad \xFF\nalso good\n");

    TailOptions opt;
    opt.malformedPolicy = MalformedPolicy::FailFast;
    ChunkedTail tail(opt);
    EXPECT_EQ(tail.tail(path, 1), (std::vector<std::string>{"also good"}));
    EXPECT_THROW(tail.tail(path, 2), TailError);
}

TEST(ForwardLineSplitterTest, CarriesPartialLineAcrossFeeds) {
    TailOptions opt;
    ForwardLineSplitter splitter(opt);

    EXPECT_TRUE(splitter.feed("hel").empty());
    EXPECT_EQ(splitter.pending_bytes(), 3u);
    EXPECT_EQ(splitter.feed("lo\nwor"), (std::vector<std::string>{"hello"}));
    EXPECT_EQ(splitter.feed("ld\r\n\n"), (std::vector<std::string>{"world", ""}));
    EXPECT_EQ(splitter.pending_bytes(), 0u);
}

TEST(ForwardLineSplitterTest, MultiByteSplitAcrossFeeds) {
    TailOptions opt;
    opt.malformedPolicy = MalformedPolicy::FailFast;
    ForwardLineSplitter splitter(opt);

    EXPECT_TRUE(splitter.feed("\xE2\x82").empty());
    EXPECT_EQ(splitter.feed("\xAC!\n"), (std::vector<std::string>{"\xE2\x82\xAC!"}));
}

TEST(ForwardLineSplitterTest, ResetDropsPending) {
    TailOptions opt;
    ForwardLineSplitter splitter(opt);
    splitter.feed("stale");
    splitter.reset();
    EXPECT_EQ(splitter.feed("fresh\n"), (std::vector<std::string>{"fresh"}));
}

TEST(ForwardLineSplitterTest, CarriedFragmentJoinsNextFeed) {
    TailOptions opt;
    ForwardLineSplitter splitter(opt);
    splitter.carry("par");
    EXPECT_EQ(splitter.pending_bytes(), 3u);
    EXPECT_EQ(splitter.feed("t\nnext"), (std::vector<std::string>{"part"}));
    EXPECT_EQ(splitter.pending_bytes(), 4u);
}

TEST(ForwardLineSplitterTest, SinkReceivesLinesBeforeDecodeFailure) {
    TailOptions opt;
    opt.malformedPolicy = MalformedPolicy::FailFast;
    ForwardLineSplitter splitter(opt);

    std::vector<std::string> got;
    EXPECT_THROW(splitter.feed("one\ntwo \xFF\nthree\n",
                               [&got](std::string l) { got.push_back(std::move(l)); }),
                 TailError);
    EXPECT_EQ(got, (std::vector<std::string>{"one"}));
}
