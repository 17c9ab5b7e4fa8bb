#include "openai_client.hpp"

#include <absl/strings/escaping.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>

#include "internal/ai/labels_text.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rulebook::ai {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

constexpr int kOcrMaxTokens         = 1500;
constexpr int kDescriptionMaxTokens = 800;
constexpr int kLabelsMaxTokens      = 300;

Value& Field(Struct& s, const std::string& key) {
  return (*s.mutable_fields())[key];
}

const Value* Find(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

std::string MimeTypeFor(const std::string& filename) {
  std::string ext;
  if (auto dot = filename.find_last_of('.'); dot != std::string::npos) {
    ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }
  if (ext == "png") return "image/png";
  if (ext == "webp") return "image/webp";
  if (ext == "gif") return "image/gif";
  return "image/jpeg";
}

// https://host:port/v1 -> ("https://host:port", "/v1")
std::pair<std::string, std::string> SplitEndpoint(const std::string& endpoint) {
  const auto scheme_end = endpoint.find("://");
  const auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
  const auto path_start = endpoint.find('/', host_start);
  if (path_start == std::string::npos) return {endpoint, ""};

  std::string path = endpoint.substr(path_start);
  while (!path.empty() && path.back() == '/') path.pop_back();
  return {endpoint.substr(0, path_start), path};
}

struct Extraction {
  const char*        name;
  bool               enabled;
  const std::string* prompt;
  int                max_tokens;
  model::VectorPair* pair;
};

} // namespace

OpenAiClient::OpenAiClient(runtime::config::AiConfig config) : config_(std::move(config)) {
  std::tie(scheme_host_port_, base_path_) = SplitEndpoint(config_.endpoint());
}

Struct OpenAiClient::PostJson(const std::string& path, const Struct& body) {
  std::string payload;
  auto        encode_status = google::protobuf::util::MessageToJsonString(body, &payload);
  if (!encode_status.ok()) {
    throw std::runtime_error("failed to encode AI request: " + std::string(encode_status.message()));
  }

  httplib::Client client(scheme_host_port_);
  const auto      timeout = static_cast<time_t>(config_.request_timeout_sec());
  client.set_connection_timeout(timeout, 0);
  client.set_read_timeout(timeout, 0);
  client.set_write_timeout(timeout, 0);

  httplib::Headers headers;
  if (!config_.api_key().empty()) {
    headers.emplace("Authorization", "Bearer " + config_.api_key());
  }

  auto res = client.Post(base_path_ + path, headers, payload, "application/json");
  if (!res) {
    throw util::Unavailable("AI request " + path + " failed: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    throw std::runtime_error("AI request " + path + " returned HTTP " + std::to_string(res->status) + ": " + res->body.substr(0, 512));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  Struct response;
  auto   parse_status = google::protobuf::util::JsonStringToMessage(res->body, &response, options);
  if (!parse_status.ok()) {
    throw std::runtime_error("AI response " + path + " is not a JSON object: " + std::string(parse_status.message()));
  }
  return response;
}

std::string OpenAiClient::Complete(const std::string& prompt, const std::string& image_data_url, int max_tokens) {
  Struct body;
  Field(body, "model").set_string_value(config_.vision_model());
  Field(body, "max_tokens").set_number_value(max_tokens);

  auto* messages = Field(body, "messages").mutable_list_value();
  auto* message  = messages->add_values()->mutable_struct_value();
  Field(*message, "role").set_string_value("user");

  if (image_data_url.empty()) {
    Field(*message, "content").set_string_value(prompt);
  } else {
    auto* content = Field(*message, "content").mutable_list_value();

    auto* text_part = content->add_values()->mutable_struct_value();
    Field(*text_part, "type").set_string_value("text");
    Field(*text_part, "text").set_string_value(prompt);

    auto* image_part = content->add_values()->mutable_struct_value();
    Field(*image_part, "type").set_string_value("image_url");
    auto* image_url  = Field(*image_part, "image_url").mutable_struct_value();
    Field(*image_url, "url").set_string_value(image_data_url);
  }

  auto response = PostJson("/chat/completions", body);

  // choices[0].message.content
  const auto* choices = Find(response, "choices");
  if (!choices || !choices->has_list_value() || choices->list_value().values_size() == 0) {
    throw std::runtime_error("AI response without choices");
  }
  const auto& first = choices->list_value().values(0);
  if (!first.has_struct_value()) throw std::runtime_error("AI response choice is not an object");
  const auto* reply = Find(first.struct_value(), "message");
  if (!reply || !reply->has_struct_value()) throw std::runtime_error("AI response choice without message");
  const auto* text = Find(reply->struct_value(), "content");
  if (!text || text->kind_case() != Value::kStringValue) return {};
  return text->string_value();
}

model::Embedding OpenAiClient::Embed(const std::string& text) {
  Struct body;
  Field(body, "model").set_string_value(config_.embedding_model());
  Field(body, "input").set_string_value(text);
  Field(body, "dimensions").set_number_value(config_.embedding_dimensions());

  auto response = PostJson("/embeddings", body);

  // data[0].embedding
  const auto* data = Find(response, "data");
  if (!data || !data->has_list_value() || data->list_value().values_size() == 0 || !data->list_value().values(0).has_struct_value()) {
    throw std::runtime_error("embedding response without data");
  }
  const auto* values = Find(data->list_value().values(0).struct_value(), "embedding");
  if (!values || !values->has_list_value()) throw std::runtime_error("embedding response without vector");

  model::Embedding out;
  out.reserve(static_cast<std::size_t>(values->list_value().values_size()));
  for (const auto& v : values->list_value().values()) {
    out.push_back(static_cast<float>(v.number_value()));
  }
  if (out.size() != config_.embedding_dimensions()) {
    throw std::runtime_error("embedding has " + std::to_string(out.size()) + " components, expected " +
                             std::to_string(config_.embedding_dimensions()));
  }
  return out;
}

AiProcessingResult OpenAiClient::Process(const std::shared_ptr<arrow::Buffer>& bytes, const std::string& filename) {
  AiProcessingResult result;

  const auto data_url = "data:" + MimeTypeFor(filename) + ";base64," +
                        absl::Base64Escape(std::string_view(reinterpret_cast<const char*>(bytes->data()), static_cast<std::size_t>(bytes->size())));

  const Extraction extractions[] = {
      {"ocr", config_.enable_ocr(), &config_.ocr_prompt(), kOcrMaxTokens, &result.ocr},
      {"description", config_.enable_description(), &config_.description_prompt(), kDescriptionMaxTokens, &result.description},
      {"labels", config_.enable_labels(), &config_.labeling_prompt(), kLabelsMaxTokens, &result.labels},
  };

  // Phase 1: content
  int         enabled  = 0;
  int         failures = 0;
  std::string last_error;
  for (const auto& extraction : extractions) {
    if (!extraction.enabled) continue;
    ++enabled;
    try {
      auto content = Complete(*extraction.prompt, data_url, extraction.max_tokens);
      if (!content.empty()) extraction.pair->content = std::move(content);
    } catch (const std::exception& e) {
      ++failures;
      last_error = std::string(extraction.name) + ": " + e.what();
      RULEBOOK_LOG_WARN("AI extraction failed", {observability::StringField("method", extraction.name), observability::StringField("file", filename),
                                                 observability::StringField("error", e.what())});
    }
  }

  if (enabled > 0 && failures == enabled) {
    result.success = false;
    result.error   = last_error;
    return result;
  }

  // Phase 2: embeddings
  for (const auto& extraction : extractions) {
    if (!extraction.pair->content) continue;

    const std::string text = extraction.pair == &result.labels ? LabelsToSearchableText(*extraction.pair->content) : *extraction.pair->content;
    if (text.empty()) continue;

    try {
      extraction.pair->embedding = Embed(text);
    } catch (const std::exception& e) {
      RULEBOOK_LOG_WARN("embedding failed", {observability::StringField("method", extraction.name), observability::StringField("file", filename),
                                             observability::StringField("error", e.what())});
    }
  }

  return result;
}

std::pair<bool, std::string> OpenAiClient::TestConnection() {
  if (config_.endpoint().empty()) return {false, "AI endpoint not configured"};
  if (config_.api_key().empty()) return {false, "AI API key not configured"};
  if (config_.vision_model().empty()) return {false, "AI vision model not configured"};
  if (config_.embedding_model().empty()) return {false, "AI embedding model not configured"};

  try {
    Complete("Test connection", "", 1);
    return {true, "AI connection successful"};
  } catch (const std::exception& e) {
    return {false, std::string("AI connection error: ") + e.what()};
  }
}

} // namespace rulebook::ai
