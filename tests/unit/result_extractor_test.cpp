#include "internal/learning/result_extractor.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using vaultd::learning::TolerantResultExtractor;

void TestJsonInsideProse() {
  TolerantResultExtractor extractor;

  const auto result = extractor.Extract(
      "Here is my analysis:\n"
      "```json\n"
      "{\"topics\": [{\"name\": \"a\"}, {\"name\": \"b\"}],"
      " \"insights\": [\"Notes on caching repeat themselves\", {\"text\": \"Object insight\"}],"
      " \"gaps\": [1, 2, 3],"
      " \"connections\": []}\n"
      "```\n"
      "Hope this helps.");

  assert(result.structured);
  assert(!result.Empty());
  assert(result.topic_count == 2);
  assert(result.gap_count == 3);
  assert(result.connection_count == 0);
  assert(result.insights.size() == 2);
  assert(result.insights[0] == "Notes on caching repeat themselves");
  assert(result.insights[1] == "Object insight");
  assert(result.InsightCount() == 7);
  assert(result.heuristic_lines.empty());
  assert(!result.should_continue);
}

void TestQuestionsAndPages() {
  TolerantResultExtractor extractor;

  const auto result = extractor.Extract(R"({
    "questions": [
      {"question": "Why does the cache miss on restart?", "whyItMatters": "Cold starts are slow"},
      "Plain string question?",
      {"whyItMatters": "dropped without a question"}
    ],
    "generatedContent": [
      {"pageTitle": "Cache Warmup", "blocks": ["First block", "Second block", 3]},
      {"blocks": ["no title, skipped"]}
    ],
    "synthPages": [
      {"title": "Caching Overview", "blocks": ["Summary"]}
    ]
  })");

  assert(result.structured);
  assert(result.questions.size() == 2);
  assert(result.questions[0].question == "Why does the cache miss on restart?");
  assert(result.questions[0].why_it_matters == "Cold starts are slow");
  assert(result.questions[1].question == "Plain string question?");
  assert(result.questions[1].why_it_matters.empty());

  assert(result.generated_content.size() == 1);
  assert(result.generated_content[0].title == "Cache Warmup");
  assert(result.generated_content[0].blocks.size() == 3);
  assert(result.generated_content[0].blocks[2] == "3");

  assert(result.synth_pages.size() == 1);
  assert(result.synth_pages[0].title == "Caching Overview");
}

void TestShouldContinue() {
  TolerantResultExtractor extractor;

  assert(extractor.Extract("{\"shouldContinue\": true}").should_continue == true);
  assert(extractor.Extract("{\"shouldContinue\": false, \"reason\": \"done\"}").should_continue == false);
  assert(!extractor.Extract("{\"shouldContinue\": \"yes\"}").should_continue);
}

void TestHeuristicFallback() {
  TolerantResultExtractor extractor;

  const auto result = extractor.Extract(
      "Some findings (no json here):\n"
      "- The caching layer is documented in three places\n"
      "* short\n"
      "1. Deployment notes never mention rollback steps\n"
      "2) Tests for the importer are missing entirely\n"
      "\xE2\x80\xA2 Bulleted insight that is long enough to keep\n" +
      std::string(301, 'x') + "\n");

  assert(!result.structured);
  assert(!result.Empty());
  assert(result.heuristic_lines.size() == 5);
  assert(result.heuristic_lines[0] == "Some findings (no json here):");
  assert(result.heuristic_lines[1] == "The caching layer is documented in three places");
  assert(result.heuristic_lines[2] == "Deployment notes never mention rollback steps");
  assert(result.heuristic_lines[3] == "Tests for the importer are missing entirely");
  assert(result.heuristic_lines[4] == "Bulleted insight that is long enough to keep");
  assert(result.InsightCount() == 5);
}

void TestHeuristicLinesAreCapped() {
  std::string text;
  for (int i = 0; i < 25; ++i) {
    text += "- this line is comfortably long enough " + std::to_string(i) + "\n";
  }

  const auto lines = TolerantResultExtractor::HeuristicLines(text);
  assert(lines.size() == TolerantResultExtractor::kMaxLines);
  assert(lines[0] == "this line is comfortably long enough 0");
}

void TestBrokenJsonFallsBack() {
  TolerantResultExtractor extractor;

  const auto result = extractor.Extract("{\"insights\": [\"unterminated} and then a long trailing sentence");
  assert(!result.structured);
  assert(result.heuristic_lines.size() == 1);
}

void TestEmptyResponse() {
  TolerantResultExtractor extractor;

  const auto result = extractor.Extract("ok");
  assert(result.Empty());
  assert(result.InsightCount() == 0);
}

void TestParseEmbeddedObject() {
  assert(!vaultd::learning::ParseEmbeddedObject("no braces"));
  assert(!vaultd::learning::ParseEmbeddedObject("} backwards {"));
  assert(!vaultd::learning::ParseEmbeddedObject("[1, 2]"));

  const auto object = vaultd::learning::ParseEmbeddedObject("prefix {\"a\": {\"b\": 1}} suffix");
  assert(object);
  assert(object->fields().at("a").struct_value().fields().at("b").number_value() == 1);
}

} // namespace

int main() {
  TestJsonInsideProse();
  TestQuestionsAndPages();
  TestShouldContinue();
  TestHeuristicFallback();
  TestHeuristicLinesAreCapped();
  TestBrokenJsonFallsBack();
  TestEmptyResponse();
  TestParseEmbeddedObject();

  std::cout << "vaultd_unit_result_extractor: pass\n";
  return 0;
}
