#pragma once

#include <cstdint>
#include <string>

#include "pagedstream/json-serializer.hpp"

// Item type shared by the examples.
struct Book {
  std::string title;
  std::string author;
  std::uint32_t year{};
};

template <>
struct glz::meta<Book> {
  using T = Book;
  static constexpr auto value = glz::object("title", &T::title, "author", &T::author, "year", &T::year);
};
