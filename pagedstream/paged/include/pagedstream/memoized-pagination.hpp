#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

#include "pagedstream/pagination-memo-policy.hpp"
#include "pagedstream/pagination.hpp"

namespace pagedstream {

// Function computing the pagination of a sequence. It may block, and should observe the stop token.
using PaginationProducer = std::function<Pagination(std::stop_token)>;

// Compute-once, thread safe pagination cell.
//
// The cell starts either resolved (known pagination) or empty with a producer.
// The first caller of getAsync() / get() installs a promise and runs the producer on its own thread.
// Callers arriving while it runs share the same future, so the producer is invoked once whatever
// the number of concurrent callers.
//
// On failure, every waiting caller observes a PaginationComputationError. Depending on the policy,
// later calls rethrow the same error (CacheFailure) or invoke the producer again (RetryAfterFailure).
// A computation interrupted by cancellation (CancelledError) is never memoized.
class MemoizedPagination {
 public:
  enum class State : std::uint8_t { Empty, Pending, Resolved, Failed };

  explicit MemoizedPagination(Pagination known);

  explicit MemoizedPagination(PaginationProducer producer,
                              PaginationMemoPolicy policy = PaginationMemoPolicy::CacheFailure);

  MemoizedPagination(const MemoizedPagination&) = delete;
  MemoizedPagination& operator=(const MemoizedPagination&) = delete;
  MemoizedPagination(MemoizedPagination&&) = delete;
  MemoizedPagination& operator=(MemoizedPagination&&) = delete;

  ~MemoizedPagination() = default;

  // Best known value, without blocking: the empty sentinel until resolved.
  [[nodiscard]] Pagination snapshot() const;

  // Resolved value, if any.
  [[nodiscard]] std::optional<Pagination> resolved() const;

  // Future of the pagination, starting the computation if needed.
  // The first caller runs the producer before returning, with its stop token.
  [[nodiscard]] std::shared_future<Pagination> getAsync(std::stop_token stopToken = {});

  // Blocking accessor. A stop request while waiting for another caller's computation throws CancelledError.
  // If that other caller is cancelled instead, the computation is started again for this one.
  [[nodiscard]] Pagination get(std::stop_token stopToken = {});

  // Resolves the cell with a value discovered by other means (for instance while decoding items).
  // Returns false if the cell is not empty, in which case it is left untouched.
  bool trySet(const Pagination& pagination);

  [[nodiscard]] State state() const;

  [[nodiscard]] PaginationMemoPolicy policy() const noexcept { return _policy; }

  // Number of times the producer was invoked.
  [[nodiscard]] std::size_t nbComputations() const;

 private:
  // 'computed' tells whether this call ran the producer.
  std::shared_future<Pagination> startOrJoin(std::stop_token stopToken, bool& computed);

  void compute(std::promise<Pagination>& promise, std::stop_token stopToken);

  mutable std::mutex _mutex;
  PaginationProducer _producer;
  std::shared_future<Pagination> _future;
  Pagination _value;
  std::size_t _nbComputations{};
  PaginationMemoPolicy _policy{PaginationMemoPolicy::CacheFailure};
  State _state{State::Empty};
};

using MemoizedPaginationPtr = std::shared_ptr<MemoizedPagination>;

}  // namespace pagedstream
