#include "internal/model/search_pair.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace rulebook::model {

SearchPair ParseSearchPair(std::string_view value) {
  for (auto pair : kAllSearchPairs) {
    if (ToString(pair) == value) {
      return pair;
    }
  }
  throw util::InvalidArgument("unsupported search pair '" + std::string(value) + "' (expected ocr, description or labels)");
}

} // namespace rulebook::model
