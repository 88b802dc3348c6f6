#pragma once

#include <string>
#include <vector>

namespace fimgate {

// Line budget around the cursor. Bounds prompt size independent of file size.
struct PromptWindow {
  int prefix_lines{60};
  int suffix_lines{60};
};

// Windowed view of the text around the cursor.
struct PromptContext {
  std::string prefix;
  std::string suffix;
  std::string language;
};

// Keeps the last `prefix_lines` lines of `prefix` and the first
// `suffix_lines` lines of `suffix`, splitting on '\n' and preserving order.
PromptContext WindowPrompt(const std::string &prefix, const std::string &suffix,
                           const std::string &language,
                           const PromptWindow &window);

struct PromptResult {
  bool ok{false};
  std::string text;
  std::string error;
};

// Fill-in-the-middle prompt template. Supports literal text and field actions
// {{.Prefix}}, {{.Suffix}} and {{.Language}}, with "{{-" / "-}}" trimming the
// adjacent whitespace.
class PromptTemplate {
 public:
  struct ParseResult;

  // Syntax errors (unclosed or unsupported actions) are reported, never
  // turned into an empty template.
  static ParseResult Parse(const std::string &source);

  // Fails when an action names a field PromptContext does not have.
  PromptResult Render(const PromptContext &context) const;

  const std::string &Source() const { return source_; }

 private:
  struct Segment {
    bool is_field{false};
    std::string text; // literal text or field name
  };

  std::string source_;
  std::vector<Segment> segments_;
};

struct PromptTemplate::ParseResult {
  bool ok{false};
  PromptTemplate prompt_template;
  std::string error;
};

// Instructions for the backend, parameterized only by language name.
std::string BuildSystemPrompt(const std::string &language);

// Windows the prefix/suffix pair and renders it through `prompt_template`.
PromptResult BuildTaskPrompt(const std::string &prefix,
                             const std::string &suffix,
                             const PromptTemplate &prompt_template,
                             const PromptWindow &window = {},
                             const std::string &language = {});

} // namespace fimgate
