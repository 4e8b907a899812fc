// Python chunker: indentation-driven, no interpreter required.
#include "chunker.hpp"
#include <re2/re2.h>
#include <filesystem>
#include <string>
#include <vector>

namespace {

struct LineInfo {
  int indent = 0;
  bool blank = true;
  bool comment = false;    // only a '#' comment
  bool logical = true;     // starts a logical line (not inside brackets/strings)
  bool in_string = false;  // starts inside a triple-quoted string
};

int indent_width(const std::string& line) {
  int w = 0;
  for (char c : line) {
    if (c == ' ') ++w;
    else if (c == '\t') w = (w / 8 + 1) * 8;
    else break;
  }
  return w;
}

// One pass over the source tracking strings, comments, brackets and
// backslash continuations, recorded per line.
std::vector<LineInfo> scan_lines(const TextLines& lines) {
  std::vector<LineInfo> info(lines.count() + 1);
  char triple = 0;       // quote char of an open triple-quoted string
  int depth = 0;
  bool continued = false;

  for (int n = 1; n <= lines.count(); ++n) {
    std::string s = lines.line(n);
    LineInfo& li = info[n];
    li.in_string = triple != 0;
    li.logical = !triple && depth == 0 && !continued;
    li.indent = indent_width(s);
    auto first = s.find_first_not_of(" \t\r");
    li.blank = first == std::string::npos;
    li.comment = !li.blank && !triple && s[first] == '#';

    std::size_t i = 0;
    bool commented = false;
    continued = false;
    while (i < s.size()) {
      if (triple) {
        auto close = s.find(std::string(3, triple), i);
        if (close == std::string::npos) { i = s.size(); break; }
        triple = 0;
        i = close + 3;
        continue;
      }
      char c = s[i];
      if (c == '#') { commented = true; break; }
      if (c == '"' || c == '\'') {
        if (s.compare(i, 3, std::string(3, c)) == 0) {
          triple = c;
          i += 3;
          continue;
        }
        ++i;
        while (i < s.size() && s[i] != c) {
          if (s[i] == '\\') ++i;
          ++i;
        }
        ++i;
        continue;
      }
      if (c == '(' || c == '[' || c == '{') ++depth;
      else if ((c == ')' || c == ']' || c == '}') && depth > 0) --depth;
      ++i;
    }
    // a backslash inside a comment continues nothing
    if (!triple && !commented) {
      auto last = s.find_last_not_of(" \t\r");
      continued = last != std::string::npos && s[last] == '\\';
    }
  }
  return info;
}

struct Open {
  int indent;
  int end;
  bool is_class;
};

bool starts_triple_quote(const std::string& s) {
  auto p = s.find_first_not_of(" \t");
  if (p == std::string::npos) return false;
  while (p < s.size() && std::string("rRuUbBfF").find(s[p]) != std::string::npos) ++p;
  return s.compare(p, 3, "\"\"\"") == 0 || s.compare(p, 3, "'''") == 0;
}

} // namespace

std::vector<Chunk> PythonChunker::parse(const std::string& path, const std::string& content) const {
  static const RE2 def_re(R"(^[ \t]*(?:async[ \t]+)?def[ \t]+([A-Za-z_][A-Za-z0-9_]*))");
  static const RE2 class_re(R"(^[ \t]*class[ \t]+([A-Za-z_][A-Za-z0-9_]*))");

  TextLines lines(content);
  auto info = scan_lines(lines);
  const int n_lines = lines.count();

  auto body_text = [&](int ls, int le) {
    if (include_comments_) return lines.slice(ls, le);
    std::string out;
    for (int n = ls; n <= le; ++n) {
      if (info[n].comment) continue;
      if (!out.empty()) out += '\n';
      out += lines.line(n);
    }
    return out;
  };

  std::vector<Chunk> chunks;

  // module docstring: first statement of the file
  for (int n = 1; n <= n_lines; ++n) {
    if (info[n].blank || info[n].comment) continue;
    if (info[n].logical && starts_triple_quote(lines.line(n))) {
      int end = n;
      // the closing line itself starts inside the string
      while (end + 1 <= n_lines && info[end + 1].in_string) ++end;
      Chunk c;
      c.file = path;
      c.type = chunk_types::kModuleDoc;
      c.name = std::filesystem::path(path).filename().string() + ":module";
      c.text = lines.slice(n, end);
      c.ls = n;
      c.le = end;
      chunks.push_back(std::move(c));
    }
    break;
  }

  std::vector<Open> stack;
  for (int n = 1; n <= n_lines; ++n) {
    if (!info[n].logical || info[n].blank) continue;
    std::string line = lines.line(n);
    std::string name;
    bool is_class = false;
    if (RE2::PartialMatch(line, def_re, &name)) {
      is_class = false;
    } else if (RE2::PartialMatch(line, class_re, &name)) {
      is_class = true;
    } else {
      continue;
    }
    const int indent = info[n].indent;

    // header runs to the end of the (possibly multi-line) signature
    int header_end = n;
    while (header_end + 1 <= n_lines && !info[header_end + 1].logical) ++header_end;

    int end = header_end;
    for (int j = header_end + 1; j <= n_lines; ++j) {
      const LineInfo& li = info[j];
      if (li.blank) continue;
      if (li.logical && !li.comment && li.indent <= indent) break;
      if (!li.comment || !li.logical) end = j;
    }

    // decorators, including ones whose arguments span lines
    int start = n;
    while (start - 1 >= 1 && !info[start - 1].blank) {
      int k = start - 1;
      while (k > 1 && !info[k].logical) --k;
      std::string p = lines.line(k);
      auto first = p.find_first_not_of(" \t");
      if (!info[k].logical || first == std::string::npos || p[first] != '@' || info[k].indent != indent) break;
      start = k;
    }

    while (!stack.empty() && (stack.back().end < n || stack.back().indent >= indent)) stack.pop_back();
    bool in_class = !stack.empty() && stack.back().is_class;

    Chunk c;
    c.file = path;
    c.type = is_class ? chunk_types::kClass : (in_class ? chunk_types::kMethod : chunk_types::kFunction);
    c.name = name;
    c.text = body_text(start, end);
    c.ls = start;
    c.le = end;
    chunks.push_back(std::move(c));

    stack.push_back(Open{indent, end, is_class});
  }
  return chunks;
}
