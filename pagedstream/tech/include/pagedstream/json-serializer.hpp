#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>
#include <string_view>

#include "pagedstream/raw-chars.hpp"

namespace pagedstream {

// Item type metadata is given ahead of time through glaze: either a glz::meta<T> specialization
// or glaze's aggregate reflection. Example:
//   struct Message { std::string text; };
//   template <> struct glz::meta<Message> { static constexpr auto value = glz::object("text", &Message::text); };

// Options used to write envelope values: explicit nulls are kept so that the wire envelope is stable.
inline constexpr glz::opts kWriteOpts{.skip_null_members = false};

// Options used to read items: unknown fields are tolerated or rejected.
inline constexpr glz::opts kLenientReadOpts{.error_on_unknown_keys = false};
inline constexpr glz::opts kStrictReadOpts{.error_on_unknown_keys = true};

/// Serialize a C++ object to JSON string using glaze.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  std::string out;
  if (glz::write<kWriteOpts>(obj, out)) {
    return {};
  }
  return out;
}

/// Serialize a C++ object and append its JSON representation to 'out'.
/// Returns false if glaze reported an error, in which case 'out' is left untouched.
template <typename T>
[[nodiscard]] bool AppendJson(const T& obj, std::string& scratch, RawChars& out) {
  scratch.clear();
  if (glz::write<kWriteOpts>(obj, scratch)) {
    return false;
  }
  out.append(std::string_view(scratch));
  return true;
}

/// Parse one JSON value held in 'json' into 'obj'. Returns false on failure, with 'error' describing it.
template <typename T>
[[nodiscard]] bool DeserializeFromJson(const std::string& json, bool allowUnknownFields, T& obj, std::string& error) {
  const auto ec = allowUnknownFields ? glz::read<kLenientReadOpts>(obj, json) : glz::read<kStrictReadOpts>(obj, json);
  if (ec) {
    error = glz::format_error(ec, json);
    return false;
  }
  return true;
}

}  // namespace pagedstream
