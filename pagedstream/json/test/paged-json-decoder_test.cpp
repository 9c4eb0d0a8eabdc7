#include "pagedstream/paged-json-decoder.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <format>
#include <limits>
#include <stop_token>
#include <string>
#include <vector>

#include "pagedstream/buffer-pool.hpp"
#include "pagedstream/decoder-config.hpp"
#include "pagedstream/errors.hpp"
#include "pagedstream/invalid_argument_exception.hpp"
#include "pagedstream/memory-channel.hpp"
#include "pagedstream/paged-sequence.hpp"
#include "pagedstream/pagination-strategy.hpp"
#include "pagedstream/pagination.hpp"
#include "test-product.hpp"

namespace pagedstream {

using test::MakeProducts;
using test::Product;

namespace {

constexpr std::string_view kPaginationJson =
    R"({"PageSize":5,"CurrentPage":2,"ContinuationToken":"next-page","TotalCount":23})";

const Pagination kPagination = Pagination::Create(5, 2, "next-page", 23);

std::string ItemsJson(const std::vector<Product>& products) {
  std::string json = "[";
  for (const auto& product : products) {
    if (json.size() > 1) {
      json.push_back(',');
    }
    json.append(std::format(R"({{"name":"{}","price":{}}})", product.name, product.price));
  }
  json.push_back(']');
  return json;
}

std::string Envelope(const std::vector<Product>& products) {
  return std::format(R"({{"pagination":{},"items":{}}})", kPaginationJson, ItemsJson(products));
}

}  // namespace

class PagedJsonDecoderTest : public ::testing::Test {
 protected:
  BufferPool pool;
};

TEST_F(PagedJsonDecoderTest, DecodesWholePayload) {
  const auto products = MakeProducts(3);
  const std::string payload = Envelope(products);
  MemoryByteReader reader(payload);
  PagedJsonDecoder<Product> decoder(reader, {}, pool);

  EXPECT_EQ(decoder.sequence().pagination(), kPagination);
  EXPECT_EQ(ToVector(decoder.sequence()), products);
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);

  const auto stats = decoder.stats();
  EXPECT_EQ(stats.nbItemsDecoded, 3U);
  EXPECT_EQ(stats.nbItemsSkipped, 0U);
  EXPECT_EQ(stats.nbBytesConsumed, payload.size());
}

TEST_F(PagedJsonDecoderTest, DecodesOneByteAtATime) {
  const auto products = MakeProducts(20);
  const std::string payload = Envelope(products);
  MemoryByteReader reader(payload, 1);
  PagedJsonDecoder<Product> decoder(reader, DecoderConfig{}.withInitialBufferSize(8), pool);

  EXPECT_EQ(ToVector(decoder.sequence()), products);
  EXPECT_EQ(decoder.sequence().paginationSnapshot(), kPagination);
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
  EXPECT_GE(reader.nbReads(), payload.size());
}

TEST_F(PagedJsonDecoderTest, ReadChunkSizeLimitsEachPull) {
  const auto products = MakeProducts(10);
  const std::string payload = Envelope(products);
  MemoryByteReader reader(payload);
  PagedJsonDecoder<Product> decoder(reader, DecoderConfig{}.withReadChunkSize(16), pool);
  EXPECT_EQ(ToVector(decoder.sequence()), products);
  EXPECT_GE(reader.nbReads(), payload.size() / 16);
}

TEST_F(PagedJsonDecoderTest, MemoryIsBoundedByItemSize) {
  const auto products = MakeProducts(1000);
  const std::string payload = Envelope(products);
  MemoryByteReader reader(payload, 7);
  PagedJsonDecoder<Product> decoder(reader, DecoderConfig{}.withInitialBufferSize(64), pool);

  EXPECT_EQ(ToVector(decoder.sequence()).size(), products.size());
  // the pagination object is the largest value of the payload
  EXPECT_LE(decoder.stats().peakBufferCapacity, 128U);
}

TEST_F(PagedJsonDecoderTest, EmptyItemsArray) {
  const std::string payload = Envelope({});
  MemoryByteReader reader(payload);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_TRUE(ToVector(sequence).empty());
  EXPECT_EQ(sequence.pagination(), kPagination);
}

TEST_F(PagedJsonDecoderTest, MissingItemsKey) {
  const std::string payload = std::format(R"({{"pagination":{},"meta":{{"a":[1,2]}}}})", kPaginationJson);
  MemoryByteReader reader(payload, 3);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_TRUE(ToVector(sequence).empty());
  EXPECT_EQ(sequence.pagination(), kPagination);
}

TEST_F(PagedJsonDecoderTest, MissingPaginationDefaultsToEmpty) {
  const auto products = MakeProducts(2);
  const std::string payload = std::format(R"({{"items":{}}})", ItemsJson(products));
  MemoryByteReader reader(payload);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_EQ(sequence.pagination(), Pagination{});
  EXPECT_EQ(ToVector(sequence), products);
}

TEST_F(PagedJsonDecoderTest, EmptyStream) {
  MemoryByteReader reader("");
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_TRUE(ToVector(sequence).empty());
  EXPECT_EQ(sequence.pagination(), Pagination{});
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
}

TEST_F(PagedJsonDecoderTest, ClampsTotalCount) {
  const std::string payload = std::format(R"({{"pagination":{{"PageSize":10,"TotalCount":{}}},"items":[]}})",
                                          (std::uint64_t{1} << 31) + 100);
  MemoryByteReader reader(payload);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_EQ(sequence.pagination().totalCount, std::numeric_limits<std::int32_t>::max());
}

TEST_F(PagedJsonDecoderTest, SkipsItemsThatCannotBeConverted) {
  const std::string payload =
      R"({"items":[{"name":"a","price":1},{"name":5},"oops",{"name":"b","price":2,"color":"red"},)"
      R"({"name":"c","price":3}]})";
  MemoryByteReader reader(payload, 5);
  PagedJsonDecoder<Product> decoder(reader, {}, pool);
  const std::vector<Product> expected{{"a", 1}, {"b", 2}, {"c", 3}};
  EXPECT_EQ(ToVector(decoder.sequence()), expected);
  EXPECT_EQ(decoder.stats().nbItemsDecoded, 3U);
  EXPECT_EQ(decoder.stats().nbItemsSkipped, 2U);
}

TEST_F(PagedJsonDecoderTest, UnknownItemFieldsCanBeRejected) {
  const std::string payload = R"({"items":[{"name":"a","price":1},{"name":"b","price":2,"color":"red"}]})";
  MemoryByteReader reader(payload);
  PagedJsonDecoder<Product> decoder(reader, DecoderConfig{}.withUnknownItemFields(false), pool);
  EXPECT_EQ(ToVector(decoder.sequence()), (std::vector<Product>{{"a", 1}}));
  EXPECT_EQ(decoder.stats().nbItemsSkipped, 1U);
}

TEST_F(PagedJsonDecoderTest, MalformedPayloadAbortsEnumeration) {
  const std::string payload = R"({"pagination":{"PageSize":1},"items":[{"name":"a","price":1} {"name":"b"}]})";
  MemoryByteReader reader(payload);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  auto enumerator = sequence.enumerate();
  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.current().name, "a");
  EXPECT_THROW(enumerator.advance(), DecodeError);
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);

  // the pagination had been read before the failure
  EXPECT_EQ(sequence.pagination().pageSize, 1U);
}

TEST_F(PagedJsonDecoderTest, MalformedPayloadFailsPagination) {
  MemoryByteReader reader(R"({"items":[1,2)");
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_THROW(static_cast<void>(sequence.pagination()), PaginationComputationError);
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
}

TEST_F(PagedJsonDecoderTest, InvalidPaginationIsADecodeError) {
  MemoryByteReader reader(R"({"pagination":{"PageSize":"five"},"items":[]})");
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  auto enumerator = sequence.enumerate();
  EXPECT_THROW(enumerator.advance(), DecodeError);
}

TEST_F(PagedJsonDecoderTest, PaginationIsReadBeforeItems) {
  const auto products = MakeProducts(500);
  const std::string payload = Envelope(products);
  MemoryByteReader reader(payload, 64);
  PagedJsonDecoder<Product> decoder(reader, {}, pool);

  EXPECT_EQ(decoder.sequence().pagination(), kPagination);
  // only the beginning of the payload was needed
  EXPECT_LT(reader.consumed(), 256U);
  EXPECT_EQ(decoder.stats().nbItemsDecoded, 0U);

  EXPECT_EQ(ToVector(decoder.sequence()), products);
}

TEST_F(PagedJsonDecoderTest, ItemsBeforePaginationAreKept) {
  const auto products = MakeProducts(4);
  const std::string payload = std::format(R"({{"items":{},"pagination":{}}})", ItemsJson(products), kPaginationJson);
  MemoryByteReader reader(payload, 10);
  PagedJsonDecoder<Product> decoder(reader, {}, pool);

  EXPECT_EQ(decoder.sequence().pagination(), kPagination);
  EXPECT_EQ(decoder.stats().nbItemsDecoded, 4U);
  EXPECT_EQ(ToVector(decoder.sequence()), products);
}

TEST_F(PagedJsonDecoderTest, EnumeratorPicksUpPaginationFoundWhileDecoding) {
  const auto products = MakeProducts(3);
  const std::string payload = Envelope(products);
  MemoryByteReader reader(payload, 4);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_EQ(sequence.paginationSnapshot(), Pagination{});

  auto enumerator = sequence.withStrategy(PaginationStrategy::PerItem).enumerate();
  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination().pageSize, 5U);
  EXPECT_EQ(enumerator.pagination().currentPage, 1U);
  EXPECT_EQ(enumerator.pagination().totalCount, 23);
  EXPECT_EQ(sequence.paginationSnapshot(), kPagination);
}

TEST_F(PagedJsonDecoderTest, SingleConsumer) {
  const auto products = MakeProducts(3);
  const std::string payload = Envelope(products);
  MemoryByteReader reader(payload);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  auto view = sequence.withStrategy(PaginationStrategy::PerPage);

  EXPECT_EQ(ToVector(view), products);
  EXPECT_TRUE(ToVector(sequence).empty());
  EXPECT_TRUE(ToVector(view).empty());
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
}

TEST_F(PagedJsonDecoderTest, CancellationDoesNotBreakPagination) {
  const auto products = MakeProducts(3);
  const std::string payload = std::format(R"({{"items":{},"pagination":{}}})", ItemsJson(products), kPaginationJson);
  MemoryByteReader reader(payload, 8);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);

  std::stop_source source;
  auto enumerator = sequence.enumerate(source.get_token());
  ASSERT_TRUE(enumerator.advance());
  source.request_stop();
  EXPECT_THROW(enumerator.advance(), CancelledError);

  EXPECT_EQ(sequence.pagination(), kPagination);
}

TEST_F(PagedJsonDecoderTest, CancelledPaginationCanBeRequestedAgain) {
  const std::string payload = Envelope(MakeProducts(2));
  MemoryByteReader reader(payload, 8);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);

  std::stop_source source;
  source.request_stop();
  EXPECT_THROW(static_cast<void>(sequence.pagination(source.get_token())), CancelledError);
  EXPECT_EQ(sequence.pagination(), kPagination);
}

TEST_F(PagedJsonDecoderTest, TopLevelArray) {
  const auto products = MakeProducts(3);
  const std::string payload = ItemsJson(products);
  {
    MemoryByteReader reader(payload, 5);
    auto sequence = DecodePagedJson<Product>(reader, DecoderConfig{}.withTopLevelArray(), pool);
    EXPECT_EQ(ToVector(sequence), products);
    EXPECT_EQ(sequence.pagination(), Pagination{});
  }
  {
    MemoryByteReader reader(payload);
    auto sequence = DecodePagedJson<Product>(reader, {}, pool);
    EXPECT_THROW(static_cast<void>(ToVector(sequence)), DecodeError);
  }
}

TEST_F(PagedJsonDecoderTest, ValueLargerThanMaxBufferSize) {
  const std::string payload = std::format(R"({{"items":[{{"name":"{}","price":1}}]}})", std::string(4096, 'x'));
  MemoryByteReader reader(payload);
  auto sequence =
      DecodePagedJson<Product>(reader, DecoderConfig{}.withInitialBufferSize(256).withMaxBufferSize(1024), pool);
  EXPECT_THROW(static_cast<void>(ToVector(sequence)), DecodeError);
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
}

TEST_F(PagedJsonDecoderTest, ArenaIsReturnedToThePool) {
  const std::string payload = Envelope(MakeProducts(3));
  MemoryByteReader reader(payload);
  auto sequence = DecodePagedJson<Product>(reader, {}, pool);
  EXPECT_EQ(pool.nbRetainedBuffers(), 0U);
  EXPECT_EQ(ToVector(sequence).size(), 3U);
  EXPECT_EQ(pool.nbRetainedBuffers(), 1U);
}

TEST_F(PagedJsonDecoderTest, BufferedModeIsRepeatable) {
  const auto products = MakeProducts(5);
  const std::string payload = std::format(R"({{"items":{},"pagination":{}}})", ItemsJson(products), kPaginationJson);
  MemoryByteReader reader(payload, 9);
  PagedJsonDecoder<Product> decoder(reader, DecoderConfig{}.withMode(DecoderConfig::Mode::Buffered), pool);
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
  EXPECT_EQ(decoder.sequence().paginationSnapshot(), kPagination);
  EXPECT_EQ(ToVector(decoder.sequence()), products);
  EXPECT_EQ(ToVector(decoder.sequence()), products);
  EXPECT_EQ(decoder.stats().nbItemsDecoded, 5U);
  EXPECT_EQ(decoder.stats().nbBytesConsumed, payload.size());
}

TEST_F(PagedJsonDecoderTest, BufferedModeIsStrict) {
  MemoryByteReader reader(R"({"items":[{"name":"a","price":1},{"name":5}]})");
  EXPECT_THROW(
      PagedJsonDecoder<Product>(reader, DecoderConfig{}.withMode(DecoderConfig::Mode::Buffered), pool),
      DecodeError);
}

TEST_F(PagedJsonDecoderTest, BufferedModePayloadLimit) {
  const std::string payload = Envelope(MakeProducts(100));
  MemoryByteReader reader(payload, 100);
  EXPECT_THROW(PagedJsonDecoder<Product>(
                   reader,
                   DecoderConfig{}.withMode(DecoderConfig::Mode::Buffered).withMaxBufferedPayloadBytes(1000), pool),
               DecodeError);
  EXPECT_EQ(reader.nbCompleteCalls(), 1U);
}

TEST_F(PagedJsonDecoderTest, InvalidConfig) {
  MemoryByteReader reader("");
  EXPECT_THROW(PagedJsonDecoder<Product>(reader, DecoderConfig{}.withInitialBufferSize(0), pool), invalid_argument);
}

}  // namespace pagedstream
