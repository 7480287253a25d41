#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <vector>

namespace vaultd::learning {

struct ExtractedPage {
  std::string              title;
  std::vector<std::string> blocks;
};

struct ExtractedQuestion {
  std::string question;
  std::string why_it_matters;
};

/*
  Structured view of one model response.

  structured is true when a JSON object was found; otherwise only
  heuristic_lines is populated.
*/
struct ExtractedResult {
  bool structured = false;

  std::vector<std::string> insights;
  size_t                   topic_count      = 0;
  size_t                   gap_count        = 0;
  size_t                   connection_count = 0;

  std::vector<ExtractedQuestion> questions;
  std::vector<ExtractedPage>     generated_content; // deep-dive
  std::vector<ExtractedPage>     synth_pages;       // synthesis

  std::optional<bool> should_continue;

  std::vector<std::string> heuristic_lines;

  size_t InsightCount() const;

  bool Empty() const {
    return !structured && heuristic_lines.empty();
  }
};

// The span from the first '{' to the last '}' of text, parsed as a JSON
// object. nullopt when there is no such span or it does not parse.
std::optional<google::protobuf::Struct> ParseEmbeddedObject(const std::string& text);

/*
  Turns free model text into an ExtractedResult. Never throws.
*/
class ResultExtractor {
 public:
  virtual ~ResultExtractor() = default;

  virtual ExtractedResult Extract(const std::string& text) const = 0;
};

/*
  JSON first: the span from the first '{' to the last '}' parsed as an
  object. On failure, line heuristics: list markers stripped, lines of
  kMinLineChars..kMaxLineChars kept, at most kMaxLines.
*/
class TolerantResultExtractor final : public ResultExtractor {
 public:
  static constexpr size_t kMinLineChars = 20;
  static constexpr size_t kMaxLineChars = 300;
  static constexpr size_t kMaxLines     = 10;

  ExtractedResult Extract(const std::string& text) const override;

  static std::vector<std::string> HeuristicLines(const std::string& text);
};

} // namespace vaultd::learning
