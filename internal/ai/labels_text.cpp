#include "labels_text.hpp"

#include <absl/strings/str_cat.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string_view>
#include <vector>

namespace rulebook::ai {

namespace {

std::string_view Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

// ```json ... ``` -> ...
std::string_view StripCodeFence(std::string_view text) {
  text = Trim(text);
  if (text.size() < 6 || text.substr(0, 3) != "```" || text.substr(text.size() - 3) != "```") return text;
  text.remove_suffix(3);
  const auto newline = text.find('\n');
  if (newline == std::string_view::npos) return Trim(text.substr(3));
  return Trim(text.substr(newline + 1));
}

std::string ValueText(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNumberValue:
      return absl::StrCat(value.number_value());
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      return {};
  }
}

std::string JoinList(const google::protobuf::ListValue& list) {
  std::string out;
  for (const auto& item : list.values()) {
    auto text = ValueText(item);
    if (text.empty()) continue;
    if (!out.empty()) out += ' ';
    out += text;
  }
  return out;
}

} // namespace

std::string LabelsToSearchableText(const std::string& labels_content) {
  const auto json = StripCodeFence(labels_content);

  google::protobuf::Value parsed;
  if (!google::protobuf::util::JsonStringToMessage(std::string(json), &parsed).ok()) {
    return labels_content;
  }

  if (parsed.has_list_value()) {
    return JoinList(parsed.list_value());
  }
  if (!parsed.has_struct_value()) {
    return labels_content;
  }

  const auto&              fields = parsed.struct_value().fields();
  std::vector<std::string> parts;

  if (auto it = fields.find("searchable_text"); it != fields.end()) {
    auto text = ValueText(it->second);
    if (!text.empty()) parts.push_back(std::move(text));
  }
  for (const char* key : {"game_elements", "key_concepts", "game_actions"}) {
    auto it = fields.find(key);
    if (it == fields.end() || !it->second.has_list_value()) continue;
    auto joined = JoinList(it->second.list_value());
    if (!joined.empty()) parts.push_back(std::move(joined));
  }

  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) out += ' ';
    out += part;
  }
  return out;
}

} // namespace rulebook::ai
