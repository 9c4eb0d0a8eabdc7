#include "pagedstream/memory-channel.hpp"

#include <gtest/gtest.h>

#include <stop_token>
#include <string_view>

#include "pagedstream/errors.hpp"
#include "pagedstream/invalid_argument_exception.hpp"

namespace pagedstream {

TEST(MemoryByteReader, WholePayloadAtOnce) {
  MemoryByteReader reader("hello");
  auto res = reader.read({});
  EXPECT_EQ(res.buffer, "hello");
  EXPECT_TRUE(res.isCompleted);
  EXPECT_EQ(reader.nbReads(), 1U);
}

TEST(MemoryByteReader, UnconsumedBytesAreReturnedAgain) {
  MemoryByteReader reader("abcdef", 2);
  auto res = reader.read({});
  EXPECT_EQ(res.buffer, "ab");
  EXPECT_FALSE(res.isCompleted);

  reader.advance(1);
  res = reader.read({});
  EXPECT_EQ(res.buffer, "bcd");
  EXPECT_FALSE(res.isCompleted);

  reader.advance(3);
  res = reader.read({});
  EXPECT_EQ(res.buffer, "ef");
  EXPECT_TRUE(res.isCompleted);
  EXPECT_EQ(reader.consumed(), 4U);
}

TEST(MemoryByteReader, EmptyPayloadIsImmediatelyCompleted) {
  MemoryByteReader reader(std::string_view{});
  auto res = reader.read({});
  EXPECT_TRUE(res.buffer.empty());
  EXPECT_TRUE(res.isCompleted);
}

TEST(MemoryByteReader, AdvancePastBufferThrows) {
  MemoryByteReader reader("abc", 1);
  reader.read({});
  EXPECT_THROW(reader.advance(2), invalid_argument);
}

TEST(MemoryByteReader, ReadObservesStopRequest) {
  MemoryByteReader reader("abc");
  std::stop_source source;
  source.request_stop();
  EXPECT_THROW(reader.read(source.get_token()), CancelledError);
}

TEST(MemoryByteReader, CountsCompleteCalls) {
  MemoryByteReader reader("abc");
  EXPECT_EQ(reader.nbCompleteCalls(), 0U);
  reader.complete();
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
}

TEST(StringByteWriter, AccumulatesAndFlushes) {
  StringByteWriter writer;
  writer.write("ab", {});
  writer.write("cd", {});
  EXPECT_EQ(writer.str(), "abcd");
  EXPECT_EQ(writer.flushedSize(), 0U);

  writer.flush({});
  EXPECT_EQ(writer.flushedSize(), 4U);
  EXPECT_EQ(writer.nbFlushes(), 1U);

  writer.write("e", {});
  writer.complete();
  EXPECT_TRUE(writer.completed());
  EXPECT_EQ(writer.flushedSize(), 5U);
  EXPECT_EQ(writer.nbWrites(), 3U);
}

TEST(StringByteWriter, WriteAfterCompleteThrows) {
  StringByteWriter writer;
  writer.complete();
  EXPECT_THROW(writer.write("x", {}), ChannelError);
}

TEST(StringByteWriter, WriteObservesStopRequest) {
  StringByteWriter writer;
  std::stop_source source;
  source.request_stop();
  EXPECT_THROW(writer.write("x", source.get_token()), CancelledError);
  EXPECT_TRUE(writer.str().empty());
}

}  // namespace pagedstream
