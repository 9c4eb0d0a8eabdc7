#include <unistd.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <format>
#include <iostream>
#include <memory>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "book.hpp"
#include "pagedstream/pagedstream.hpp"

using namespace pagedstream;

namespace {

bool ParseArg(const char *arg, std::uint64_t &value) {
  const auto [ptr, errc] = std::from_chars(arg, arg + std::strlen(arg), value);
  return errc == std::errc{} && ptr == arg + std::strlen(arg);
}

}  // namespace

// Writes one page of a catalog of books as a paginated JSON envelope on the standard output.
// Usage: encode [offset] [limit]
int main(int argc, char **argv) {
  std::uint64_t offset = 0;
  std::uint64_t limit = 10;
  if ((argc > 1 && !ParseArg(argv[1], offset)) || (argc > 2 && !ParseArg(argv[2], limit))) {
    std::cerr << "Usage: " << argv[0] << " [offset] [limit]\n";
    return EXIT_FAILURE;
  }

  // standard output carries the payload, logs go to standard error
  log::set_default_logger(log::stderr_color_mt("encode"));
  log::set_level(log::level::info);

  std::vector<Book> catalog;
  for (std::uint32_t idx = 0; idx < 1000; ++idx) {
    catalog.push_back({std::format("Volume {}", idx + 1), std::format("Author {}", idx % 37), 1900 + (idx % 125)});
  }

  try {
    auto query = std::make_shared<VectorQuery<Book>>(std::move(catalog));
    query->withOffset(offset).withLimit(limit);
    auto sequence = MakePagedSequence<Book>(std::move(query));

    FdByteWriter writer(STDOUT_FILENO);
    const auto stats = EncodePagedJson(sequence, writer, EncoderConfig{}.withFlushEveryItem());
    log::info("{} books written in {} bytes", stats.nbItemsWritten, stats.nbBytesWritten);
  } catch (const std::exception &e) {
    std::cerr << "Encoding failed: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
