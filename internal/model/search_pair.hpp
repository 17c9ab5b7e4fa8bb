#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace rulebook::model {

/*
  Which (content, embedding) pair drives similarity ranking.

  Closed set; each value maps to a fixed pair of storage columns.
  Free-form input is parsed once at the boundary.
*/
enum class SearchPair : std::uint8_t {
  kOcr,
  kDescription,
  kLabels,
};

inline constexpr std::array<SearchPair, 3> kAllSearchPairs = {SearchPair::kOcr, SearchPair::kDescription, SearchPair::kLabels};

struct PairColumns {
  std::string_view content;
  std::string_view embedding;
};

constexpr PairColumns ColumnsFor(SearchPair pair) {
  switch (pair) {
    case SearchPair::kOcr:
      return {"ocr_content", "ocr_embedding"};
    case SearchPair::kDescription:
      return {"description_content", "description_embedding"};
    case SearchPair::kLabels:
      return {"labels_content", "labels_embedding"};
  }
  return {"ocr_content", "ocr_embedding"};
}

constexpr std::string_view ToString(SearchPair pair) {
  switch (pair) {
    case SearchPair::kOcr:
      return "ocr";
    case SearchPair::kDescription:
      return "description";
    case SearchPair::kLabels:
      return "labels";
  }
  return "ocr";
}

// Throws util::InvalidArgument for anything outside the closed set.
SearchPair ParseSearchPair(std::string_view value);

} // namespace rulebook::model
