#include "internal/learning/prompt_library.hpp"

namespace vaultd::learning {

namespace {

constexpr const char* kJsonOnly = "\n\nYou may reason inside <thinking> tags first. Then output exactly one JSON object and nothing else.";

std::string Tagged(const std::string& tag, const std::string& body) {
  return "<" + tag + ">\n" + body + "\n</" + tag + ">";
}

std::string Output(const StepOutputs& outputs, StepType step) {
  auto it = outputs.find(step);
  return it == outputs.end() ? std::string() : it->second;
}

std::string DepthInstruction(Depth depth) {
  switch (depth) {
    case Depth::kShallow:
      return "Write one or two short paragraphs per gap covering only the essential point.";
    case Depth::kDeep:
      return "Write a full explainer per gap: definitions, several examples, history where relevant and common misconceptions.";
    case Depth::kModerate:
      break;
  }
  return "Write three to five paragraphs per gap with a definition and one concrete example.";
}

PromptPair Inventory(const PromptInputs& in) {
  return {
      std::string("You survey a collection of personal notes and list the knowledge they contain. "
                  "Merge duplicate topics, rate each topic's coverage as sparse, moderate or rich, "
                  "list distinct concepts and the topics mentioned only once, and estimate how densely "
                  "the notes reference each other on a 0.0 to 1.0 scale.\n\n"
                  "Schema: {\"topics\": [{\"name\": string, \"coverage\": string, \"pageCount\": number}], "
                  "\"concepts\": [string], \"orphanTopics\": [string], \"connectionDensity\": number}") +
          kJsonOnly,
      "Inventory these notes.\n\n" + Tagged("notes", in.corpus),
  };
}

PromptPair GapAnalysis(const PromptInputs& in) {
  return {
      std::string("You find what a set of notes does not yet explain: undefined terms, unsupported claims, "
                  "incomplete processes, sparse topics, related topics that never reference each other and "
                  "assumed background. Rate every gap critical, important or minor.\n\n"
                  "Schema: {\"gaps\": [{\"topic\": string, \"severity\": string, \"reason\": string, \"suggestedAction\": string}], "
                  "\"weakConnections\": [{\"topicA\": string, \"topicB\": string, \"relationship\": string}], "
                  "\"missingContext\": [{\"assumption\": string, \"usedIn\": string, \"explanation\": string}]}") +
          kJsonOnly,
      "Find the gaps in these notes using the inventory.\n\n" + Tagged("notes", in.corpus) + "\n\n" +
          Tagged("inventory", Output(in.outputs, StepType::kInventory)),
  };
}

PromptPair DeepDive(const PromptInputs& in) {
  return {
      "You write new note content that fills the listed gaps, critical gaps first. Match the voice of the "
      "existing notes, use markdown, keep each block self-contained and do not repeat existing content. " +
          DepthInstruction(in.depth) +
          "\n\nSchema: {\"generatedContent\": [{\"pageTitle\": string, \"gapAddressed\": string, \"blocks\": [string]}]}" + kJsonOnly,
      "Fill these gaps.\n\n" + Tagged("notes", in.corpus) + "\n\n" + Tagged("gaps", Output(in.outputs, StepType::kGapAnalysis)) +
          "\n\n" + Tagged("depth", ToString(in.depth)),
  };
}

PromptPair CrossReference(const PromptInputs& in) {
  return {
      std::string("You find connections between note pages that the author has not made: shared concepts, "
                  "causal chains, analogies, prerequisites, contradictions and temporal links. Use page titles "
                  "exactly as they appear and describe each relationship specifically. Most valuable first.\n\n"
                  "Schema: {\"connections\": [{\"sourcePageTitle\": string, \"targetPageTitle\": string, "
                  "\"relationship\": string, \"connectionType\": string, \"suggestedLinkText\": string}]}") +
          kJsonOnly,
      "Find hidden connections between these notes.\n\n" + Tagged("notes", in.corpus),
  };
}

PromptPair Synthesis(const PromptInputs& in) {
  return {
      std::string("You write one to three overview pages, each built around a theme that runs through several "
                  "notes. Write a narrative in markdown blocks, reference source notes as [[Page Title]] links "
                  "and close with open directions. Give each page a descriptive title.\n\n"
                  "Schema: {\"synthPages\": [{\"title\": string, \"summary\": string, \"blocks\": [string]}]}") +
          kJsonOnly,
      "Synthesise these notes and their connections.\n\n" + Tagged("notes", in.corpus) + "\n\n" +
          Tagged("connections", Output(in.outputs, StepType::kCrossReference)),
  };
}

PromptPair Questions(const PromptInputs& in) {
  return {
      std::string("You ask specific questions the notes do not answer yet, at surface, analytical and "
                  "philosophical depth, most thought-provoking first.\n\n"
                  "Schema: {\"questions\": [{\"question\": string, \"relatedTopics\": [string], \"depth\": string, "
                  "\"whyItMatters\": string}]}") +
          kJsonOnly,
      "Ask what these notes leave unanswered.\n\n" + Tagged("notes", in.corpus) + "\n\n" +
          Tagged("inventory", Output(in.outputs, StepType::kInventory)),
  };
}

PromptPair Iterate(const PromptInputs& in) {
  std::string summary;
  for (const auto& [step, text] : in.outputs) {
    if (!summary.empty()) summary += "\n\n";
    summary += "### " + ToString(step) + "\n" + text.substr(0, kIterateSummaryEntryChars);
  }

  return {
      std::string("You decide whether another pass of the learning protocol would add real value. Continue "
                  "only while critical or important gaps remain unfilled or the notes are still poorly "
                  "connected. Stop when the remaining gaps are minor or new output repeats existing notes.\n\n"
                  "Schema: {\"shouldContinue\": boolean, \"reason\": string, \"confidenceScore\": number, "
                  "\"focusAreas\": [string]}") +
          kJsonOnly,
      "Should another iteration run?\n\n" + Tagged("notes", in.corpus) + "\n\n" + Tagged("session-summary", summary),
  };
}

} // namespace

PromptPair DefaultPromptLibrary::Build(StepType step, const PromptInputs& inputs) const {
  switch (step) {
    case StepType::kInventory:
      return Inventory(inputs);
    case StepType::kGapAnalysis:
      return GapAnalysis(inputs);
    case StepType::kDeepDive:
      return DeepDive(inputs);
    case StepType::kCrossReference:
      return CrossReference(inputs);
    case StepType::kSynthesis:
      return Synthesis(inputs);
    case StepType::kQuestions:
      return Questions(inputs);
    case StepType::kIterate:
      return Iterate(inputs);
  }
  return Inventory(inputs);
}

} // namespace vaultd::learning
