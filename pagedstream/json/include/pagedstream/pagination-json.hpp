#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "pagedstream/json-serializer.hpp"
#include "pagedstream/pagination.hpp"
#include "pagedstream/raw-chars.hpp"

namespace pagedstream {

// Wire representation of Pagination. The total count is read with the widest type so that producers
// using 64 bits counts are clamped instead of rejected.
struct PaginationWire {
  std::uint32_t pageSize{};
  std::uint32_t currentPage{};
  std::optional<std::string> continuationToken;
  std::optional<std::uint64_t> totalCount;
};

[[nodiscard]] PaginationWire ToWire(const Pagination& pagination);

[[nodiscard]] Pagination FromWire(PaginationWire&& wire) noexcept;

// Appends the JSON object of 'pagination' to 'out'. Null members are written explicitly.
void AppendPaginationJson(const Pagination& pagination, std::string& scratch, RawChars& out);

// Parses the pagination JSON object 'json'. Unknown properties are ignored, null is the empty pagination.
// Returns false on failure, with 'error' describing it.
[[nodiscard]] bool ParsePaginationJson(std::string_view json, Pagination& pagination, std::string& error);

}  // namespace pagedstream

template <>
struct glz::meta<pagedstream::PaginationWire> {
  using T = pagedstream::PaginationWire;
  static constexpr auto value = glz::object("PageSize", &T::pageSize, "CurrentPage", &T::currentPage,
                                            "ContinuationToken", &T::continuationToken, "TotalCount", &T::totalCount);
};
