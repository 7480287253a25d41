#include "internal/learning/result_extractor.hpp"

#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <sstream>

namespace vaultd::learning {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

const ListValue* ListAt(const Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kListValue) {
    return nullptr;
  }
  return &it->second.list_value();
}

size_t CountAt(const Struct& object, const std::string& key) {
  const ListValue* list = ListAt(object, key);
  return list ? static_cast<size_t>(list->values_size()) : 0;
}

std::string StringField(const Value& value, const std::string& key) {
  if (value.kind_case() != Value::kStructValue) return {};
  const auto& fields = value.struct_value().fields();
  auto        it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != Value::kStringValue) return {};
  return it->second.string_value();
}

std::string ValueText(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kNumberValue: {
      std::ostringstream out;
      out << value.number_value();
      return out.str();
    }
    case Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      return {};
  }
}

std::vector<std::string> Blocks(const Value& item) {
  std::vector<std::string> out;
  if (item.kind_case() != Value::kStructValue) return out;

  const auto& fields = item.struct_value().fields();
  auto        it     = fields.find("blocks");
  if (it == fields.end() || it->second.kind_case() != Value::kListValue) return out;

  for (const auto& block : it->second.list_value().values()) {
    std::string text = ValueText(block);
    if (!text.empty()) out.push_back(std::move(text));
  }
  return out;
}

std::vector<ExtractedPage> Pages(const Struct& object, const std::string& key, const std::string& title_key) {
  std::vector<ExtractedPage> out;
  const ListValue*           list = ListAt(object, key);
  if (!list) return out;

  for (const auto& item : list->values()) {
    ExtractedPage page;
    page.title = StringField(item, title_key);
    if (page.title.empty()) continue;
    page.blocks = Blocks(item);
    out.push_back(std::move(page));
  }
  return out;
}

std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end   = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

// "- x", "* x", "• x", "12. x", "3) x"
std::string StripListMarker(const std::string& line) {
  if (line.rfind("\xE2\x80\xA2", 0) == 0) {
    return Trim(line.substr(3));
  }
  if (!line.empty() && (line[0] == '-' || line[0] == '*' || line[0] == '+')) {
    return Trim(line.substr(1));
  }

  size_t digits = 0;
  while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) ++digits;
  if (digits > 0 && digits < line.size() && (line[digits] == '.' || line[digits] == ')')) {
    return Trim(line.substr(digits + 1));
  }
  return line;
}

} // namespace

size_t ExtractedResult::InsightCount() const {
  if (!structured) return heuristic_lines.size();
  return insights.size() + topic_count + gap_count + connection_count + questions.size();
}

std::optional<Struct> ParseEmbeddedObject(const std::string& text) {
  const size_t open  = text.find('{');
  const size_t close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    return std::nullopt;
  }

  Struct object;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(text.substr(open, close - open + 1), &object, options);
  if (!status.ok()) {
    return std::nullopt;
  }
  return object;
}

ExtractedResult TolerantResultExtractor::Extract(const std::string& text) const {
  ExtractedResult result;

  auto parsed = ParseEmbeddedObject(text);
  if (!parsed) {
    result.heuristic_lines = HeuristicLines(text);
    return result;
  }

  const Struct& object = *parsed;
  result.structured    = true;

  if (const ListValue* insights = ListAt(object, "insights")) {
    for (const auto& v : insights->values()) {
      std::string s = ValueText(v);
      result.insights.push_back(s.empty() ? StringField(v, "text") : s);
    }
  }

  result.topic_count      = CountAt(object, "topics");
  result.gap_count        = CountAt(object, "gaps");
  result.connection_count = CountAt(object, "connections");

  if (const ListValue* questions = ListAt(object, "questions")) {
    for (const auto& v : questions->values()) {
      ExtractedQuestion q;
      if (v.kind_case() == Value::kStringValue) {
        q.question = v.string_value();
      } else {
        q.question       = StringField(v, "question");
        q.why_it_matters = StringField(v, "whyItMatters");
      }
      if (!q.question.empty()) result.questions.push_back(std::move(q));
    }
  }

  result.generated_content = Pages(object, "generatedContent", "pageTitle");
  result.synth_pages       = Pages(object, "synthPages", "title");

  auto it = object.fields().find("shouldContinue");
  if (it != object.fields().end() && it->second.kind_case() == Value::kBoolValue) {
    result.should_continue = it->second.bool_value();
  }
  return result;
}

std::vector<std::string> TolerantResultExtractor::HeuristicLines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream       in(text);
  std::string              line;

  while (out.size() < kMaxLines && std::getline(in, line)) {
    std::string cleaned = StripListMarker(Trim(line));
    if (cleaned.size() < kMinLineChars || cleaned.size() > kMaxLineChars) continue;
    out.push_back(std::move(cleaned));
  }
  return out;
}

} // namespace vaultd::learning
