#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include "seglog/sinks/console_sink.hpp"
#include "test_helpers.hpp"

using seglog_test::MakeLogEntry;

// Renders only the message and remembers how often it was asked to.
class MessageOnlyFormatter : public seglog::IFormatter
{
 public:
  int calls = 0;

  size_t Format(const seglog::LogEntry& entry, char* buf, size_t buf_size) override
  {
    ++calls;
    size_t n = std::min<size_t>(entry.msg_len, buf_size - 1);
    std::memcpy(buf, entry.msg, n);
    buf[n] = '\0';
    return n;
  }
};

class ConsoleSinkTest : public ::testing::Test
{
 protected:
  FILE* out_ = nullptr;
  FILE* err_ = nullptr;

  void SetUp() override
  {
    out_ = std::tmpfile();
    err_ = std::tmpfile();
    ASSERT_NE(out_, nullptr);
    ASSERT_NE(err_, nullptr);
  }

  void TearDown() override
  {
    if (out_) std::fclose(out_);
    if (err_) std::fclose(err_);
  }

  static std::string Contents(FILE* f)
  {
    std::fflush(f);
    std::rewind(f);
    std::string data;
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
    {
      data.append(buf, n);
    }
    return data;
  }
};

TEST_F(ConsoleSinkTest, DefaultLevelIsTrace)
{
  seglog::ConsoleSink sink(false, out_, err_);
  EXPECT_EQ(sink.Level(), seglog::LogLevel::Trace);
}

TEST_F(ConsoleSinkTest, ShouldLogFiltering)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.SetLevel(seglog::LogLevel::Warn);

  EXPECT_FALSE(sink.ShouldLog(seglog::LogLevel::Trace));
  EXPECT_FALSE(sink.ShouldLog(seglog::LogLevel::Info));
  EXPECT_TRUE(sink.ShouldLog(seglog::LogLevel::Warn));
  EXPECT_TRUE(sink.ShouldLog(seglog::LogLevel::Fatal));
}

TEST_F(ConsoleSinkTest, WriteFilteredByLevel)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.SetLevel(seglog::LogLevel::Warn);
  sink.Write(MakeLogEntry(seglog::LogLevel::Info));

  EXPECT_TRUE(Contents(out_).empty());
  EXPECT_TRUE(Contents(err_).empty());
}

TEST_F(ConsoleSinkTest, InfoGoesToOut)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.Write(MakeLogEntry(seglog::LogLevel::Info));
  sink.Write(MakeLogEntry(seglog::LogLevel::Debug));

  std::string out = Contents(out_);
  EXPECT_NE(out.find("hello world"), std::string::npos);
  EXPECT_NE(out.find("[segment_file.cpp:88]"), std::string::npos);
  EXPECT_EQ(out.back(), '\n');
  EXPECT_TRUE(Contents(err_).empty());
}

TEST_F(ConsoleSinkTest, WarnAndWorseGoToErr)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.Write(MakeLogEntry(seglog::LogLevel::Warn));
  sink.Write(MakeLogEntry(seglog::LogLevel::Error));
  sink.Write(MakeLogEntry(seglog::LogLevel::Fatal));

  std::string err = Contents(err_);
  EXPECT_NE(err.find("WARNING"), std::string::npos);
  EXPECT_NE(err.find("ERROR"), std::string::npos);
  EXPECT_NE(err.find("FATAL"), std::string::npos);
  EXPECT_TRUE(Contents(out_).empty());
}

TEST_F(ConsoleSinkTest, ColorEnabledOutput)
{
  seglog::ConsoleSink sink(true, out_, err_);
  sink.Write(MakeLogEntry());
  EXPECT_NE(Contents(out_).find("\033["), std::string::npos);
}

TEST_F(ConsoleSinkTest, ColorDisabledOutput)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.Write(MakeLogEntry());
  EXPECT_EQ(Contents(out_).find("\033["), std::string::npos);
}

TEST_F(ConsoleSinkTest, ColorAutoOffForFiles)
{
  seglog::ConsoleSink sink(std::nullopt, out_, err_);
  sink.Write(MakeLogEntry());
  EXPECT_EQ(Contents(out_).find("\033["), std::string::npos);
}

TEST_F(ConsoleSinkTest, SetFormatterCustom)
{
  seglog::ConsoleSink sink(false, out_, err_);
  auto formatter = std::make_unique<MessageOnlyFormatter>();
  auto* raw = formatter.get();
  sink.SetFormatter(std::move(formatter));

  sink.Write(MakeLogEntry());
  EXPECT_EQ(raw->calls, 1);
  EXPECT_EQ(Contents(out_), "hello world\n");
}

TEST_F(ConsoleSinkTest, ForcedColorIsReported)
{
  EXPECT_TRUE(seglog::ConsoleSink(true, out_, err_).ColorEnabled());
  EXPECT_FALSE(seglog::ConsoleSink(false, out_, err_).ColorEnabled());
  EXPECT_FALSE(seglog::ConsoleSink(std::nullopt, out_, err_).ColorEnabled());
}

TEST_F(ConsoleSinkTest, OffEntriesAreDropped)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.Write(MakeLogEntry(seglog::LogLevel::Off));
  EXPECT_TRUE(Contents(out_).empty());
  EXPECT_TRUE(Contents(err_).empty());
}

TEST_F(ConsoleSinkTest, EmptyRenderingWritesNothing)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.SetFormatter(std::make_unique<MessageOnlyFormatter>());
  sink.Write(MakeLogEntry(seglog::LogLevel::Info, ""));
  EXPECT_TRUE(Contents(out_).empty());
}

TEST_F(ConsoleSinkTest, FlushPushesBufferedOutput)
{
  seglog::ConsoleSink sink(false, out_, err_);
  sink.Write(MakeLogEntry());
  sink.Flush();
  EXPECT_GT(std::ftell(out_), 0L);
}
