#include <unistd.h>

#include <cstdlib>
#include <exception>
#include <iostream>

#include "book.hpp"
#include "pagedstream/pagedstream.hpp"

using namespace pagedstream;

// Reads a paginated JSON envelope of books from the standard input, printing the pagination first
// and then each book as soon as it is decoded. Try it with:
//   encode 40 20 | decode
int main() {
  try {
    FdByteReader reader(STDIN_FILENO);
    PagedJsonDecoder<Book> decoder(reader);

    const auto pagination = decoder.sequence().pagination();
    std::cout << ToString(pagination) << '\n';

    auto enumerator = decoder.sequence().withStrategy(PaginationStrategy::PerPage).enumerate();
    while (enumerator.advance()) {
      const Book &book = enumerator.current();
      std::cout << "  [" << enumerator.itemIndex() << "] " << book.title << " by " << book.author << " (" << book.year
                << ")\n";
    }

    const auto stats = decoder.stats();
    std::cout << stats.nbItemsDecoded << " books decoded, " << stats.nbItemsSkipped << " skipped, "
              << stats.nbBytesConsumed << " bytes read\n";
  } catch (const std::exception &e) {
    std::cerr << "Decoding failed: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
