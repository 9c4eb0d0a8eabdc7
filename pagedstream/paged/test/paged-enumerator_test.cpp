#include "pagedstream/paged-enumerator.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "pagedstream/errors.hpp"
#include "pagedstream/item-cursor.hpp"
#include "pagedstream/memoized-pagination.hpp"
#include "pagedstream/pagination-strategy.hpp"
#include "pagedstream/pagination.hpp"

namespace pagedstream {

namespace {

const Pagination kInput = Pagination::Create(5, 2, std::nullopt, 23);

CursorPtr<std::string> MakeCursor(std::vector<std::string> items) {
  return MakeVectorCursor(std::make_shared<const std::vector<std::string>>(std::move(items)));
}

// Cursor recording whether it was destroyed.
class TrackedCursor final : public ItemCursor<int> {
 public:
  explicit TrackedCursor(bool& destroyed) : _destroyed(destroyed) {}
  TrackedCursor(const TrackedCursor&) = delete;
  TrackedCursor& operator=(const TrackedCursor&) = delete;
  ~TrackedCursor() override { _destroyed = true; }

  bool next(std::stop_token) override { return ++_value <= 3; }
  int& current() override { return _value; }

 private:
  bool& _destroyed;
  int _value{};
};

}  // namespace

TEST(PagedEnumerator, NoneStrategyKeepsPagination) {
  PagedEnumerator<std::string> enumerator(MakeCursor({"A", "B", "C"}), kInput);
  std::vector<std::string> items;
  while (enumerator.advance()) {
    items.push_back(enumerator.current());
    EXPECT_EQ(enumerator.pagination(), kInput);
  }
  EXPECT_EQ(items, (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(enumerator.pagination(), kInput);
  EXPECT_EQ(enumerator.itemIndex(), 3U);
}

TEST(PagedEnumerator, PerPageStrategy) {
  PagedEnumerator<std::string> enumerator(MakeCursor({"A", "B", "C"}), kInput, PaginationStrategy::PerPage);
  while (enumerator.advance()) {
  }
  EXPECT_EQ(enumerator.pagination().currentPage, 1U);
  EXPECT_EQ(enumerator.pagination().totalCount, 23);
}

TEST(PagedEnumerator, PerItemStrategyFinalizesTotalCount) {
  PagedEnumerator<std::string> enumerator(MakeCursor({"A", "B", "C", "D"}), Pagination{}, PaginationStrategy::PerItem);
  std::uint32_t expectedPage = 0;
  while (enumerator.advance()) {
    EXPECT_EQ(enumerator.pagination().currentPage, ++expectedPage);
    EXPECT_FALSE(enumerator.pagination().totalCount);
  }
  EXPECT_EQ(enumerator.pagination().totalCount, 4);
}

TEST(PagedEnumerator, EndOfSequenceUpdateAppliedOnce) {
  PagedEnumerator<std::string> enumerator(MakeCursor({"A"}), Pagination{}, PaginationStrategy::PerItem);
  EXPECT_TRUE(enumerator.advance());
  EXPECT_FALSE(enumerator.advance());
  EXPECT_FALSE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination().totalCount, 1);
  EXPECT_EQ(enumerator.itemIndex(), 1U);
}

TEST(PagedEnumerator, StrategyCanBeSwitchedBetweenSteps) {
  PagedEnumerator<std::string> enumerator(MakeCursor({"A", "B", "C", "D", "E", "F", "G"}), kInput);
  ASSERT_TRUE(enumerator.advance());
  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination().currentPage, 2U);

  enumerator.setStrategy(PaginationStrategy::PerItem);
  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination().currentPage, 3U);

  enumerator.setStrategy(PaginationStrategy::PerPage);
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(enumerator.advance());
  }
  // 6th item, page size 5
  EXPECT_EQ(enumerator.pagination().currentPage, 2U);
}

TEST(PagedEnumerator, CancellationSurfacesAsError) {
  std::stop_source source;
  PagedEnumerator<std::string> enumerator(MakeCursor({"A", "B"}), kInput, PaginationStrategy::None,
                                          source.get_token());
  ASSERT_TRUE(enumerator.advance());
  source.request_stop();
  EXPECT_THROW(enumerator.advance(), CancelledError);
}

TEST(PagedEnumerator, DisposeReleasesInnerCursorAndIsIdempotent) {
  bool destroyed = false;
  PagedEnumerator<int> enumerator(std::make_unique<TrackedCursor>(destroyed), Pagination{});
  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.current(), 1);

  enumerator.dispose();
  EXPECT_TRUE(destroyed);
  EXPECT_TRUE(enumerator.disposed());
  EXPECT_NO_THROW(enumerator.dispose());

  EXPECT_THROW(enumerator.advance(), ObjectDisposedError);
  EXPECT_THROW(enumerator.current(), ObjectDisposedError);
}

TEST(PagedEnumerator, DestructionReleasesInnerCursor) {
  bool destroyed = false;
  {
    PagedEnumerator<int> enumerator(std::make_unique<TrackedCursor>(destroyed), Pagination{});
    ASSERT_TRUE(enumerator.advance());
  }
  EXPECT_TRUE(destroyed);
}

TEST(PagedEnumerator, CurrentOutsideOfAnItemIsAnInvalidState) {
  PagedEnumerator<std::string> enumerator(MakeCursor({"A"}), kInput);
  EXPECT_THROW(enumerator.current(), InvalidStateError);
  EXPECT_FALSE(enumerator.disposed());

  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.current(), "A");
  EXPECT_FALSE(enumerator.advance());
  EXPECT_THROW(enumerator.current(), InvalidStateError);

  enumerator.dispose();
  EXPECT_THROW(enumerator.current(), ObjectDisposedError);
}

TEST(PagedEnumerator, InnerErrorAbortsPass) {
  auto cursor = std::make_unique<GeneratorCursor<int>>([](std::stop_token) -> std::optional<int> {
    throw DecodeError(12, "unexpected character");
  });
  PagedEnumerator<int> enumerator(std::move(cursor), Pagination{});
  EXPECT_THROW(enumerator.advance(), DecodeError);
}

TEST(PagedEnumerator, RebasesOnLateResolvedPagination) {
  auto memo = std::make_shared<MemoizedPagination>([](std::stop_token) { return Pagination{}; });
  auto items = std::make_shared<int>(0);
  auto cursor = std::make_unique<GeneratorCursor<int>>([memo, items](std::stop_token) -> std::optional<int> {
    if (*items == 1) {
      // pagination discovered while producing the second item
      memo->trySet(kInput);
    }
    if (*items == 3) {
      return std::nullopt;
    }
    return ++*items;
  });
  PagedEnumerator<int> enumerator(std::move(cursor), memo->snapshot(), PaginationStrategy::None, {}, memo);
  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination(), Pagination{});
  ASSERT_TRUE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination(), kInput);
  ASSERT_TRUE(enumerator.advance());
  EXPECT_FALSE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination(), kInput);
}

TEST(PagedEnumerator, RebaseReplaysStrategy) {
  auto memo = std::make_shared<MemoizedPagination>([](std::stop_token) { return Pagination{}; });
  auto items = std::make_shared<int>(0);
  auto cursor = std::make_unique<GeneratorCursor<int>>([memo, items](std::stop_token) -> std::optional<int> {
    if (*items == 7) {
      memo->trySet(Pagination::Create(3, 1, std::nullopt, 7));
      return std::nullopt;
    }
    return ++*items;
  });
  PagedEnumerator<int> enumerator(std::move(cursor), memo->snapshot(), PaginationStrategy::PerPage, {}, memo);
  while (enumerator.advance()) {
    EXPECT_EQ(enumerator.pagination().currentPage, 0U);
  }
  EXPECT_EQ(enumerator.pagination().pageSize, 3U);
  EXPECT_EQ(enumerator.pagination().currentPage, 3U);
  EXPECT_EQ(enumerator.pagination().totalCount, 7);
}

TEST(PagedEnumerator, NullCursorIsEmpty) {
  PagedEnumerator<int> enumerator(nullptr, kInput, PaginationStrategy::PerItem);
  EXPECT_FALSE(enumerator.advance());
  EXPECT_EQ(enumerator.pagination(), kInput);
}

}  // namespace pagedstream
