#include "pagedstream/envelope-tokenizer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "pagedstream/errors.hpp"
#include "pagedstream/json-reader-state.hpp"
#include "pagedstream/json-scanner.hpp"
#include "pagedstream/json-serializer.hpp"

namespace pagedstream {

namespace {

using Expect = JsonReaderState::Expect;
using Field = JsonReaderState::Field;
using Kind = EnvelopeToken::Kind;

void Commit(JsonReaderState& state, std::size_t pos) {
  state.totalBytesConsumed += pos - state.bytesConsumed;
  state.bytesConsumed = pos;
}

std::uint64_t AbsoluteOffset(const JsonReaderState& state, std::size_t pos) {
  return state.totalBytesConsumed + (pos - state.bytesConsumed);
}

[[noreturn]] void ThrowUnexpectedChar(const JsonReaderState& state, std::size_t pos, char ch, std::string_view expected) {
  throw DecodeError(AbsoluteOffset(state, pos), "unexpected character '{}' at offset {}, expected {}", ch,
                    AbsoluteOffset(state, pos), expected);
}

void CloseItemsArray(JsonReaderState& state) {
  if (state.topLevelArray) {
    state.expect = Expect::Trailing;
    state.depth = 0;
  } else {
    state.expect = Expect::CommaOrEnd;
    state.depth = 1;
  }
}

Field FieldOf(std::string_view name) {
  if (name == "pagination") {
    return Field::Pagination;
  }
  if (name == "items") {
    return Field::Items;
  }
  return Field::Other;
}

// Property names are matched on their unescaped value, "\u0069tems" being the same name as "items".
Field FieldOfKey(const JsonReaderState& state, std::size_t pos, std::string_view quotedKey) {
  if (quotedKey.find('\\') == std::string_view::npos) {
    return FieldOf(quotedKey.substr(1U, quotedKey.size() - 2U));
  }
  std::string name;
  std::string error;
  if (!DeserializeFromJson(std::string(quotedKey), true, name, error)) {
    throw DecodeError(AbsoluteOffset(state, pos), "invalid property name at offset {}: {}", AbsoluteOffset(state, pos),
                      error);
  }
  return FieldOf(name);
}

}  // namespace

EnvelopeToken ReadEnvelopeToken(std::string_view buffer, bool isFinalBlock, JsonReaderState state,
                                bool acceptTopLevelArray) {
  // scans one value at 'pos'. Returns false if more data is needed.
  const auto scan = [&](std::size_t pos, ScanResult& res) {
    res = ScanValue(buffer, pos, isFinalBlock);
    switch (res.status) {
      case ScanResult::Status::Complete:
        return true;
      case ScanResult::Status::Incomplete:
        if (isFinalBlock) {
          throw DecodeError(AbsoluteOffset(state, buffer.size()), "truncated value starting at offset {}",
                            AbsoluteOffset(state, pos));
        }
        return false;
      case ScanResult::Status::TooDeep:
        throw DecodeError(AbsoluteOffset(state, res.end), "value nested deeper than {} levels", kMaxJsonNestingDepth);
      default:
        throw DecodeError(AbsoluteOffset(state, res.end), "malformed value at offset {}",
                          AbsoluteOffset(state, res.end));
    }
  };

  while (true) {
    const std::size_t pos = SkipJsonWhitespace(buffer, state.bytesConsumed);
    if (pos == buffer.size()) {
      Commit(state, pos);
      if (!isFinalBlock) {
        return {Kind::NeedMoreData, {}, state};
      }
      if (state.expect == Expect::EnvelopeStart || state.expect == Expect::Trailing) {
        return {Kind::End, {}, state};
      }
      throw DecodeError(state.totalBytesConsumed, "unexpected end of payload at offset {}", state.totalBytesConsumed);
    }

    const char ch = buffer[pos];
    switch (state.expect) {
      case Expect::EnvelopeStart:
        if (ch == '{') {
          state.expect = Expect::FirstKeyOrEnd;
          state.depth = 1;
        } else if (ch == '[' && acceptTopLevelArray) {
          state.topLevelArray = true;
          state.itemsFound = true;
          state.expect = Expect::FirstItemOrEnd;
          state.depth = 1;
        } else {
          ThrowUnexpectedChar(state, pos, ch, acceptTopLevelArray ? "'{' or '['" : "'{'");
        }
        Commit(state, pos + 1U);
        break;
      case Expect::FirstKeyOrEnd:
        if (ch == '}') {
          state.expect = Expect::Trailing;
          state.depth = 0;
          Commit(state, pos + 1U);
        } else {
          state.expect = Expect::Key;
          Commit(state, pos);
        }
        break;
      case Expect::Key: {
        if (ch != '"') {
          ThrowUnexpectedChar(state, pos, ch, "a property name");
        }
        ScanResult res;
        if (!scan(pos, res)) {
          Commit(state, pos);
          return {Kind::NeedMoreData, {}, state};
        }
        state.field = FieldOfKey(state, pos, buffer.substr(pos, res.end - pos));
        state.expect = Expect::Colon;
        Commit(state, res.end);
        break;
      }
      case Expect::Colon:
        if (ch != ':') {
          ThrowUnexpectedChar(state, pos, ch, "':'");
        }
        state.expect = Expect::Value;
        Commit(state, pos + 1U);
        break;
      case Expect::Value: {
        if (state.field == Field::Items && ch == '[') {
          state.itemsFound = true;
          state.expect = Expect::FirstItemOrEnd;
          state.depth = 2;
          Commit(state, pos + 1U);
          break;
        }
        ScanResult res;
        if (!scan(pos, res)) {
          Commit(state, pos);
          return {Kind::NeedMoreData, {}, state};
        }
        state.expect = Expect::CommaOrEnd;
        Commit(state, res.end);
        if (state.field == Field::Pagination) {
          state.paginationFound = true;
          return {Kind::Pagination, buffer.substr(pos, res.end - pos), state};
        }
        // other properties, and non array items, are skipped
        break;
      }
      case Expect::CommaOrEnd:
        if (ch == ',') {
          state.expect = Expect::Key;
        } else if (ch == '}') {
          state.expect = Expect::Trailing;
          state.depth = 0;
        } else {
          ThrowUnexpectedChar(state, pos, ch, "',' or '}'");
        }
        Commit(state, pos + 1U);
        break;
      case Expect::FirstItemOrEnd:
        if (ch == ']') {
          CloseItemsArray(state);
          Commit(state, pos + 1U);
        } else {
          state.expect = Expect::Item;
          Commit(state, pos);
        }
        break;
      case Expect::Item: {
        ScanResult res;
        if (!scan(pos, res)) {
          Commit(state, pos);
          return {Kind::NeedMoreData, {}, state};
        }
        state.expect = Expect::ItemSeparator;
        Commit(state, res.end);
        return {Kind::Item, buffer.substr(pos, res.end - pos), state};
      }
      case Expect::ItemSeparator:
        if (ch == ',') {
          state.expect = Expect::Item;
        } else if (ch == ']') {
          CloseItemsArray(state);
        } else {
          ThrowUnexpectedChar(state, pos, ch, "',' or ']'");
        }
        Commit(state, pos + 1U);
        break;
      case Expect::Trailing:
        [[fallthrough]];
      default:
        ThrowUnexpectedChar(state, pos, ch, "end of payload");
    }
  }
}

}  // namespace pagedstream
