#include "chunker.hpp"
#include <re2/re2.h>
#include <filesystem>
#include <string>
#include <vector>

std::vector<Chunk> MarkdownChunker::parse(const std::string& path, const std::string& content) const {
  // whole document becomes the fallback chunk
  if (!split_by_headings_) return {};

  // a closing run of '#' only counts after whitespace, so "## C#" keeps its '#'
  static const RE2 heading_re(R"(^ {0,3}#{1,6}[ \t]+(.*?)(?:[ \t]+#+)?[ \t]*$)");
  static const RE2 fence_re(R"(^ {0,3}(```|~~~))");

  TextLines lines(content);
  const int n_lines = lines.count();

  struct Heading { int line; std::string text; };
  std::vector<Heading> headings;
  std::string fence;
  for (int n = 1; n <= n_lines; ++n) {
    std::string line = lines.line(n);
    std::string marker;
    if (RE2::PartialMatch(line, fence_re, &marker)) {
      if (fence.empty()) fence = marker;
      else if (marker == fence) fence.clear();
      continue;
    }
    if (!fence.empty()) continue;
    std::string text;
    if (RE2::PartialMatch(line, heading_re, &text) && !text.empty()) headings.push_back({n, text});
  }
  if (headings.empty()) return {};

  auto last_non_blank = [&](int from, int to) {
    while (to > from && lines.line(to).find_first_not_of(" \t\r") == std::string::npos) --to;
    return to;
  };

  std::vector<Chunk> chunks;
  std::string base = std::filesystem::path(path).filename().string();

  if (headings.front().line > 1) {
    int le = last_non_blank(1, headings.front().line - 1);
    std::string pre = lines.slice(1, le);
    if (pre.find_first_not_of(" \t\r\n") != std::string::npos) {
      Chunk c;
      c.file = path;
      c.type = chunk_types::kOther;
      c.name = base;
      c.text = pre;
      c.ls = 1;
      c.le = le;
      chunks.push_back(std::move(c));
    }
  }

  for (std::size_t i = 0; i < headings.size(); ++i) {
    int ls = headings[i].line;
    int next = i + 1 < headings.size() ? headings[i + 1].line - 1 : n_lines;
    int le = last_non_blank(ls, next);
    Chunk c;
    c.file = path;
    c.type = chunk_types::kHeadingSection;
    c.name = headings[i].text;
    c.text = lines.slice(ls, le);
    c.ls = ls;
    c.le = le;
    chunks.push_back(std::move(c));
  }
  return chunks;
}
