#include "completion/prompt_builder.h"

#include <algorithm>
#include <cctype>

namespace fimgate {

namespace {

constexpr const char *kOpenDelim = "{{";
constexpr const char *kCloseDelim = "}}";

bool IsTemplateSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    auto pos = text.find('\n', start);
    if (pos == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

std::string JoinLines(std::vector<std::string>::const_iterator begin,
                      std::vector<std::string>::const_iterator end) {
  std::string out;
  for (auto it = begin; it != end; ++it) {
    if (it != begin) {
      out.push_back('\n');
    }
    out += *it;
  }
  return out;
}

bool IsIdentifier(const std::string &name) {
  if (name.empty() ||
      !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

} // namespace

PromptContext WindowPrompt(const std::string &prefix, const std::string &suffix,
                           const std::string &language,
                           const PromptWindow &window) {
  PromptContext context;
  context.language = language;

  auto prefix_lines = SplitLines(prefix);
  std::size_t keep_prefix = static_cast<std::size_t>(std::max(window.prefix_lines, 0));
  auto prefix_begin = prefix_lines.size() > keep_prefix
                          ? prefix_lines.end() - static_cast<long>(keep_prefix)
                          : prefix_lines.begin();
  context.prefix = JoinLines(prefix_begin, prefix_lines.end());

  auto suffix_lines = SplitLines(suffix);
  std::size_t keep_suffix = static_cast<std::size_t>(std::max(window.suffix_lines, 0));
  auto suffix_end = suffix_lines.size() > keep_suffix
                        ? suffix_lines.begin() + static_cast<long>(keep_suffix)
                        : suffix_lines.end();
  context.suffix = JoinLines(suffix_lines.begin(), suffix_end);
  return context;
}

PromptTemplate::ParseResult PromptTemplate::Parse(const std::string &source) {
  ParseResult result;
  PromptTemplate &tmpl = result.prompt_template;
  tmpl.source_ = source;

  std::string literal;
  bool trim_next_literal = false;
  std::size_t pos = 0;
  while (pos < source.size()) {
    auto open = source.find(kOpenDelim, pos);
    std::string text = source.substr(pos, open == std::string::npos
                                              ? std::string::npos
                                              : open - pos);
    if (trim_next_literal) {
      auto first = std::find_if_not(text.begin(), text.end(), IsTemplateSpace);
      text.erase(text.begin(), first);
      trim_next_literal = false;
    }
    literal += text;
    if (open == std::string::npos) {
      break;
    }

    auto close = source.find(kCloseDelim, open + 2);
    if (close == std::string::npos) {
      result.error = "unclosed action at offset " + std::to_string(open);
      return result;
    }
    std::string action = source.substr(open + 2, close - open - 2);

    if (action.size() >= 2 && action[0] == '-' && IsTemplateSpace(action[1])) {
      while (!literal.empty() && IsTemplateSpace(literal.back())) {
        literal.pop_back();
      }
      action.erase(0, 1);
    }
    if (action.size() >= 2 && action.back() == '-' &&
        IsTemplateSpace(action[action.size() - 2])) {
      trim_next_literal = true;
      action.pop_back();
    }

    auto first = std::find_if_not(action.begin(), action.end(), IsTemplateSpace);
    auto last = std::find_if_not(action.rbegin(), action.rend(), IsTemplateSpace);
    action = first == action.end() ? std::string()
                                   : std::string(first, last.base());
    pos = close + 2;

    if (action.size() >= 4 && action.compare(0, 2, "/*") == 0 &&
        action.compare(action.size() - 2, 2, "*/") == 0) {
      continue;
    }
    if (action.empty()) {
      result.error = "missing value for action at offset " + std::to_string(open);
      return result;
    }
    if (action[0] != '.' || !IsIdentifier(action.substr(1))) {
      result.error = "unsupported action {{" + action + "}}";
      return result;
    }

    if (!literal.empty()) {
      tmpl.segments_.push_back({false, literal});
      literal.clear();
    }
    tmpl.segments_.push_back({true, action.substr(1)});
  }
  if (!literal.empty()) {
    tmpl.segments_.push_back({false, literal});
  }
  result.ok = true;
  return result;
}

PromptResult PromptTemplate::Render(const PromptContext &context) const {
  PromptResult result;
  for (const auto &segment : segments_) {
    if (!segment.is_field) {
      result.text += segment.text;
    } else if (segment.text == "Prefix") {
      result.text += context.prefix;
    } else if (segment.text == "Suffix") {
      result.text += context.suffix;
    } else if (segment.text == "Language") {
      result.text += context.language;
    } else {
      result.text.clear();
      result.error = "can't evaluate field " + segment.text;
      return result;
    }
  }
  result.ok = true;
  return result;
}

std::string BuildSystemPrompt(const std::string &language) {
  return "You are an expert AI programming assistant for " + language +
         ". \n"
         "Your goal is to perform Fill-in-the-Middle (FIM) code completion. "
         "Complete only the code that fits between the given prefix and "
         "suffix. \n"
         "Do not add explanations, comments, or markdown. Do not change code "
         "outside the specified boundaries.";
}

PromptResult BuildTaskPrompt(const std::string &prefix,
                             const std::string &suffix,
                             const PromptTemplate &prompt_template,
                             const PromptWindow &window,
                             const std::string &language) {
  return prompt_template.Render(WindowPrompt(prefix, suffix, language, window));
}

} // namespace fimgate
