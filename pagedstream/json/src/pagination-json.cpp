#include "pagedstream/pagination-json.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "pagedstream/errors.hpp"
#include "pagedstream/json-serializer.hpp"
#include "pagedstream/pagination.hpp"
#include "pagedstream/raw-chars.hpp"

namespace pagedstream {

PaginationWire ToWire(const Pagination& pagination) {
  PaginationWire wire{pagination.pageSize, pagination.currentPage, pagination.continuationToken, std::nullopt};
  if (pagination.totalCount) {
    wire.totalCount = static_cast<std::uint64_t>(*pagination.totalCount);
  }
  return wire;
}

Pagination FromWire(PaginationWire&& wire) noexcept {
  Pagination pagination;
  pagination.pageSize = wire.pageSize;
  pagination.currentPage = wire.currentPage;
  pagination.continuationToken = std::move(wire.continuationToken);
  if (wire.totalCount) {
    pagination.totalCount = ClampTotalCount(*wire.totalCount);
  }
  return pagination;
}

void AppendPaginationJson(const Pagination& pagination, std::string& scratch, RawChars& out) {
  if (!AppendJson(ToWire(pagination), scratch, out)) {
    throw ItemConversionError("unable to serialize pagination {}", ToString(pagination));
  }
}

bool ParsePaginationJson(std::string_view json, Pagination& pagination, std::string& error) {
  if (json == "null") {
    pagination = Pagination{};
    return true;
  }
  const std::string buf(json);
  PaginationWire wire;
  if (!DeserializeFromJson(buf, true, wire, error)) {
    return false;
  }
  pagination = FromWire(std::move(wire));
  return true;
}

}  // namespace pagedstream
