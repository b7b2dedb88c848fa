#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "common/tail_error.hpp"
#include "writer/base_writer.hpp"
#include "writer/file_writer.hpp"
#include "test_util.hpp"

using namespace backtail;
using namespace backtail::test;

namespace {

// 记录每一批的大小
class RecordingWriter : public base_writer {
public:
    explicit RecordingWriter(std::size_t cap) : base_writer("recording", cap) {}
    ~RecordingWriter() override { flush_on_destroy(); }

    std::vector<std::size_t> batches;
    std::vector<std::string> lines;

protected:
    void flush_impl(const std::vector<std::string>& batch) override {
        batches.push_back(batch.size());
        lines.insert(lines.end(), batch.begin(), batch.end());
    }
};

std::string read_all(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace

TEST(BaseWriterTest, FlushesWhenBatchIsFull) {
    RecordingWriter w(3);
    for (int i = 0; i < 7; ++i)
        w.write("l" + std::to_string(i));
    EXPECT_EQ(w.batches, (std::vector<std::size_t>{3, 3}));
    EXPECT_EQ(w.lines_written(), 6u);

    w.flush();
    EXPECT_EQ(w.batches, (std::vector<std::size_t>{3, 3, 1}));
    EXPECT_EQ(w.lines.back(), "l6");
    EXPECT_EQ(w.lines_written(), 7u);

    // 空缓冲不触发 flush_impl
    w.flush();
    EXPECT_EQ(w.batches.size(), 3u);
}

TEST(FileWriterTest, AppendsLinesAndFlushesOnDestroy) {
    TempDir dir;
    auto path = dir.file("out.txt");
    write_file(path, "existing\n");
    {
        FileWriter w(path, 2);
        w.write("a");
        w.write("");
        w.write("c");
        EXPECT_EQ(read_all(path), "existing\na\n\n");
    }
    EXPECT_EQ(read_all(path), "existing\na\n\nc\n");
}

TEST(FileWriterTest, UnopenableOutputIsIOFailure) {
    TempDir dir;
    try {
        FileWriter w(dir.file("no/such/dir/out.txt"));
        FAIL() << "expected TailError";
    } catch (const TailError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IOFailure);
    }
}

TEST(MakeWriterTest, DashMeansStdout) {
    TempDir dir;
    EXPECT_EQ(make_writer("-")->name(), "stdout");
    EXPECT_EQ(make_writer("")->name(), "stdout");
    auto path = dir.file("o.txt");
    EXPECT_EQ(make_writer(path)->name(), "file:" + path);
}
