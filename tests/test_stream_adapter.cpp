#include "termbar/io/stream_adapter.hpp"
#include "termbar/core/progress_bar.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <system_error>
#include <unistd.h>

using termbar::core::ProgressBar;
using termbar::io::ProgressReader;
using termbar::io::ProgressWriter;
using termbar::testing::CapturingSink;
using termbar::testing::ManualClock;

namespace {

class ClosableReader : public termbar::io::ByteReader {
public:
    explicit ClosableReader(std::string data) : data_(std::move(data)) {}
    
    size_t read(char* buffer, size_t size) override {
        size_t n = std::min(size, data_.size() - offset_);
        data_.copy(buffer, n, offset_);
        offset_ += n;
        return n;
    }
    bool supportsClose() const override { return true; }
    void close() override { closed = true; }
    
    bool closed = false;

private:
    std::string data_;
    size_t offset_ = 0;
};

}

class StreamAdapterTest : public ::testing::Test {
protected:
    std::unique_ptr<ProgressBar> makeBar(int64_t max) {
        return std::make_unique<ProgressBar>(max, termbar::core::BarOptions{}, sink_,
                                             std::make_shared<termbar::io::FixedTerminalSize>(80),
                                             std::make_shared<ManualClock>());
    }
    
    std::shared_ptr<CapturingSink> sink_ = std::make_shared<CapturingSink>();
};

TEST_F(StreamAdapterTest, ReaderAdvancesByBytesRead) {
    std::string payload(1000, 'p');
    std::istringstream in(payload);
    std::ostringstream out;
    
    auto bar = makeBar(1000);
    termbar::io::IstreamReader source(in);
    termbar::io::OstreamWriter target(out);
    ProgressReader reader(source, *bar);
    
    size_t copied = termbar::io::copyStream(reader, target, 64);
    
    EXPECT_EQ(copied, 1000u);
    EXPECT_EQ(out.str(), payload);
    EXPECT_EQ(bar->current(), 1000);
    EXPECT_TRUE(bar->isFinished());
}

TEST_F(StreamAdapterTest, CloseFinishesBarForPlainReader) {
    std::istringstream in(std::string(500, 'a'));
    std::ostringstream out;
    
    auto bar = makeBar(1000);
    termbar::io::IstreamReader source(in);
    termbar::io::OstreamWriter target(out);
    ProgressReader reader(source, *bar);
    
    termbar::io::copyStream(reader, target, 128);
    EXPECT_FALSE(bar->isFinished());
    
    reader.close();
    EXPECT_TRUE(bar->isFinished());
    EXPECT_EQ(bar->current(), 1000);
}

TEST_F(StreamAdapterTest, CloseClosesClosableReader) {
    auto bar = makeBar(1000);
    ClosableReader source("abc");
    ProgressReader reader(source, *bar);
    
    char buffer[8];
    EXPECT_EQ(reader.read(buffer, sizeof(buffer)), 3u);
    reader.close();
    
    EXPECT_TRUE(source.closed);
    EXPECT_FALSE(bar->isFinished());
    EXPECT_EQ(bar->current(), 3);
}

TEST_F(StreamAdapterTest, WriterAdvancesByBytesWritten) {
    std::ostringstream out;
    auto bar = makeBar(10);
    termbar::io::OstreamWriter target(out);
    ProgressWriter writer(target, *bar);
    
    writer.write("hello", 5);
    EXPECT_EQ(bar->current(), 5);
    
    writer.close();
    EXPECT_TRUE(bar->isFinished());
    EXPECT_EQ(out.str(), "hello");
}

TEST_F(StreamAdapterTest, OverflowFromReaderPropagates) {
    std::istringstream in(std::string(20, 'x'));
    auto bar = makeBar(10);
    termbar::io::IstreamReader source(in);
    ProgressReader reader(source, *bar);
    
    char buffer[32];
    EXPECT_THROW(reader.read(buffer, sizeof(buffer)), termbar::core::BarError);
}

TEST_F(StreamAdapterTest, DescriptorPipeRoundTrip) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    
    auto bar = makeBar(4);
    {
        termbar::io::FileDescriptorWriter raw_writer(fds[1], true);
        ProgressWriter writer(raw_writer, *bar);
        writer.write("data", 4);
        writer.close();
    }
    
    termbar::io::FileDescriptorReader reader(fds[0], true);
    char buffer[8];
    EXPECT_EQ(reader.read(buffer, sizeof(buffer)), 4u);
    EXPECT_EQ(reader.read(buffer, sizeof(buffer)), 0u);
    EXPECT_TRUE(bar->isFinished());
}

TEST_F(StreamAdapterTest, DescriptorReadErrorThrows) {
    termbar::io::FileDescriptorReader reader(-1, false);
    char buffer[4];
    EXPECT_THROW(reader.read(buffer, sizeof(buffer)), std::system_error);
}
