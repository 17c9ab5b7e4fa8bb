#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/ai/ai_client.hpp"

namespace google::protobuf {
class Struct;
}

namespace rulebook::ai {

/*
  OpenAI-compatible HTTP client (chat completions + embeddings).

  endpoint is the API root, e.g. https://api.openai.com/v1; requests go
  to <endpoint>/chat/completions and <endpoint>/embeddings.

  Images are sent inline as base64 data URLs. Every enabled extraction
  is a separate request; each non-empty result is embedded separately.
*/
class OpenAiClient final : public AiProcessingClient, public EmbeddingClient {
 public:
  explicit OpenAiClient(runtime::config::AiConfig config);

  AiProcessingResult           Process(const std::shared_ptr<arrow::Buffer>& bytes, const std::string& filename) override;
  std::pair<bool, std::string> TestConnection() override;
  model::Embedding             Embed(const std::string& text) override;

 private:
  // Returns the assistant message text; throws on transport/HTTP/parse failure.
  std::string Complete(const std::string& prompt, const std::string& image_data_url, int max_tokens);

  // POST <base_path><path>; returns the parsed JSON object.
  google::protobuf::Struct PostJson(const std::string& path, const google::protobuf::Struct& body);

  runtime::config::AiConfig config_;
  std::string               scheme_host_port_;
  std::string               base_path_;
};

} // namespace rulebook::ai
