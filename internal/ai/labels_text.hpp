#pragma once

#include <string>

namespace rulebook::ai {

/*
  Text embedded for the labels pair.

  JSON object -> searchable_text + game_elements + key_concepts + game_actions
  JSON array  -> elements joined by spaces
  otherwise   -> the content unchanged

  A surrounding markdown code fence is ignored.
*/
std::string LabelsToSearchableText(const std::string& labels_content);

} // namespace rulebook::ai
