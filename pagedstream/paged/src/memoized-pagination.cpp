#include "pagedstream/memoized-pagination.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

#include "pagedstream/errors.hpp"
#include "pagedstream/invalid_argument_exception.hpp"
#include "pagedstream/log.hpp"
#include "pagedstream/pagination-memo-policy.hpp"
#include "pagedstream/pagination.hpp"

namespace pagedstream {

namespace {

// Granularity at which callers waiting for another caller's computation observe their stop token.
constexpr std::chrono::milliseconds kWaitSlice{10};

std::shared_future<Pagination> MakeReadyFuture(const Pagination& pagination) {
  std::promise<Pagination> promise;
  promise.set_value(pagination);
  return promise.get_future().share();
}

}  // namespace

MemoizedPagination::MemoizedPagination(Pagination known)
    : _future(MakeReadyFuture(known)), _value(std::move(known)), _state(State::Resolved) {}

MemoizedPagination::MemoizedPagination(PaginationProducer producer, PaginationMemoPolicy policy)
    : _producer(std::move(producer)), _policy(policy) {
  if (!_producer) {
    throw invalid_argument("pagination producer should not be empty");
  }
}

Pagination MemoizedPagination::snapshot() const {
  std::scoped_lock lock(_mutex);
  return _state == State::Resolved ? _value : Pagination{};
}

std::optional<Pagination> MemoizedPagination::resolved() const {
  std::scoped_lock lock(_mutex);
  if (_state == State::Resolved) {
    return _value;
  }
  return std::nullopt;
}

std::shared_future<Pagination> MemoizedPagination::getAsync(std::stop_token stopToken) {
  bool computed;
  return startOrJoin(std::move(stopToken), computed);
}

std::shared_future<Pagination> MemoizedPagination::startOrJoin(std::stop_token stopToken, bool& computed) {
  std::promise<Pagination> promise;
  std::shared_future<Pagination> future;
  {
    std::scoped_lock lock(_mutex);
    computed = _state == State::Empty;
    if (!computed) {
      return _future;
    }
    _state = State::Pending;
    future = promise.get_future().share();
    _future = future;
    ++_nbComputations;
  }
  compute(promise, std::move(stopToken));
  return future;
}

Pagination MemoizedPagination::get(std::stop_token stopToken) {
  while (true) {
    bool computed;
    auto future = startOrJoin(stopToken, computed);
    while (future.wait_for(kWaitSlice) != std::future_status::ready) {
      if (stopToken.stop_requested()) {
        throw CancelledError();
      }
    }
    try {
      return future.get();
    } catch (const CancelledError&) {
      if (computed || stopToken.stop_requested()) {
        throw;
      }
      // the caller running the computation was cancelled, not this one: the cell is empty again
      log::debug("shared pagination computation was cancelled, computing it again");
    }
  }
}

bool MemoizedPagination::trySet(const Pagination& pagination) {
  std::scoped_lock lock(_mutex);
  if (_state != State::Empty) {
    return false;
  }
  _value = pagination;
  _future = MakeReadyFuture(pagination);
  _state = State::Resolved;
  return true;
}

MemoizedPagination::State MemoizedPagination::state() const {
  std::scoped_lock lock(_mutex);
  return _state;
}

std::size_t MemoizedPagination::nbComputations() const {
  std::scoped_lock lock(_mutex);
  return _nbComputations;
}

void MemoizedPagination::compute(std::promise<Pagination>& promise, std::stop_token stopToken) {
  std::exception_ptr error;
  try {
    Pagination result = _producer(std::move(stopToken));
    {
      std::scoped_lock lock(_mutex);
      _value = result;
      _state = State::Resolved;
    }
    promise.set_value(std::move(result));
    return;
  } catch (const CancelledError&) {
    log::debug("pagination computation cancelled");
    {
      std::scoped_lock lock(_mutex);
      _state = State::Empty;
      _future = {};
    }
    promise.set_exception(std::current_exception());
    return;
  } catch (const PaginationComputationError& ex) {
    log::error("pagination computation failed: {}", ex.what());
    error = std::current_exception();
  } catch (const std::exception& ex) {
    log::error("pagination computation failed: {}", ex.what());
    error = std::make_exception_ptr(PaginationComputationError("pagination computation failed: {}", ex.what()));
  } catch (...) {
    log::error("pagination computation failed with an unknown error");
    error = std::make_exception_ptr(PaginationComputationError("pagination computation failed: unknown error"));
  }

  {
    std::scoped_lock lock(_mutex);
    if (_policy == PaginationMemoPolicy::CacheFailure) {
      _state = State::Failed;
    } else {
      _state = State::Empty;
      _future = {};
    }
  }
  promise.set_exception(error);
}

}  // namespace pagedstream
