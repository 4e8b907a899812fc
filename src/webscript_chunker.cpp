// TypeScript / JavaScript chunker. Regexes find declarations, brace
// matching finds their bodies. Both run over a masked copy of the source
// where comments, string contents and regex literals are blanked, so
// braces inside them never count.
#include "chunker.hpp"
#include <re2/re2.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <vector>

namespace {

// True when a '/' at i opens a regex literal rather than dividing: nothing
// value-like (identifier, number, literal or closing bracket) comes before
// it, or the word before it is a keyword that takes an expression.
bool regex_can_start(const std::string& m, std::size_t i) {
  std::size_t k = i;
  while (k > 0 && std::isspace((unsigned char)m[k - 1])) --k;
  if (k == 0) return true;
  char p = m[k - 1];
  if (p == ')' || p == ']' || p == '"' || p == '\'' || p == '`') return false;
  if (std::isalnum((unsigned char)p) || p == '_' || p == '$') {
    std::size_t b = k;
    while (b > 0 && (std::isalnum((unsigned char)m[b - 1]) || m[b - 1] == '_' || m[b - 1] == '$')) --b;
    static const std::set<std::string> keywords = {
      "return", "typeof", "instanceof", "in", "of", "case", "void", "delete", "throw", "new", "yield", "await"};
    return keywords.count(m.substr(b, k - b)) > 0;
  }
  return true;
}

std::string mask_source(const std::string& src) {
  std::string m = src;
  enum { Code, Line, Block, Str, Regex } st = Code;
  char quote = 0;
  bool in_class = false;  // inside [...] of a regex literal
  std::size_t regex_open = std::string::npos;
  std::size_t not_regex = std::string::npos;
  for (std::size_t i = 0; i < src.size(); ++i) {
    char c = src[i];
    char next = i + 1 < src.size() ? src[i + 1] : '\0';
    switch (st) {
      case Code:
        if (c == '/' && next == '/') { st = Line; m[i] = ' '; }
        else if (c == '/' && next == '*') { st = Block; m[i] = ' '; }
        else if (c == '/' && i != not_regex && regex_can_start(m, i)) { st = Regex; in_class = false; regex_open = i; }
        else if (c == '"' || c == '\'' || c == '`') { st = Str; quote = c; }
        break;
      case Line:
        if (c == '\n') st = Code; else m[i] = ' ';
        break;
      case Block:
        if (c == '*' && next == '/') { m[i] = ' '; m[i + 1] = ' '; ++i; st = Code; }
        else if (c != '\n') m[i] = ' ';
        break;
      case Str:
        if (c == '\\' && i + 1 < src.size()) {
          m[i] = ' ';
          if (src[i + 1] != '\n') m[i + 1] = ' ';
          ++i;
        } else if (c == quote) {
          st = Code;
        } else if (c == '\n' && quote != '`') {
          st = Code;  // unterminated literal; resync at end of line
        } else if (c != '\n') {
          m[i] = ' ';
        }
        break;
      case Regex:
        if (c == '\n') {
          // not a regex after all: unmask and rescan the line as code
          for (std::size_t k = regex_open; k < i; ++k) m[k] = src[k];
          not_regex = regex_open;
          i = regex_open - 1;
          st = Code;
        } else if (c == '\\' && next != '\n' && i + 1 < src.size()) {
          m[i] = ' ';
          m[i + 1] = ' ';
          ++i;
        } else if (c == '/' && !in_class) {
          st = Code;
        } else {
          if (c == '[') in_class = true;
          else if (c == ']') in_class = false;
          m[i] = ' ';
        }
        break;
    }
  }
  return m;
}

// Offset one past the bracket that closes the one at open, or npos.
std::size_t match_close(const std::string& m, std::size_t open) {
  char o = m[open];
  char c = o == '{' ? '}' : o == '(' ? ')' : ']';
  int depth = 0;
  for (std::size_t i = open; i < m.size(); ++i) {
    if (m[i] == o) ++depth;
    else if (m[i] == c && --depth == 0) return i + 1;
  }
  return std::string::npos;
}

std::size_t skip_ws(const std::string& m, std::size_t i) {
  while (i < m.size() && std::isspace((unsigned char)m[i])) ++i;
  return i;
}

// From the end of a parameter list, skips an optional ": ReturnType" and
// returns the offset of the body's '{', or npos if a ';' or '=>' comes first.
std::size_t find_body_open(const std::string& m, std::size_t from) {
  int angle = 0;
  for (std::size_t i = from; i < m.size(); ++i) {
    char c = m[i];
    if (c == '<') ++angle;
    else if (c == '>' && angle > 0) --angle;
    else if (c == '{' && angle == 0) {
      // "{ a: T }" as a return type is followed by another '{'
      std::size_t close = match_close(m, i);
      if (close == std::string::npos) return i;
      std::size_t k = skip_ws(m, close);
      bool typed = false;
      for (std::size_t j = from; j < i; ++j) if (m[j] == ':') { typed = true; break; }
      if (typed && k < m.size() && m[k] == '{') { i = k - 1; continue; }
      return i;
    } else if (c == ';' || (c == '=' && i + 1 < m.size() && m[i + 1] == '>')) {
      return std::string::npos;
    }
  }
  return std::string::npos;
}

struct Decl {
  std::size_t start;   // offset of the declaration keyword line
  std::size_t end;     // one past the body
  std::string name;
  const char* type;
};

// Calls fn(match_begin, match_end, name) for every match of re in m.
template <typename Fn>
void for_each_match(const RE2& re, const std::string& m, std::size_t from, std::size_t to, Fn fn) {
  re2::StringPiece groups[2];
  std::size_t pos = from;
  while (pos < to && re.Match(m, pos, to, RE2::UNANCHORED, groups, 2)) {
    std::size_t b = groups[0].data() - m.data();
    std::size_t e = b + groups[0].size();
    fn(b, e, std::string(groups[1].data(), groups[1].size()));
    pos = e > b ? e : b + 1;
  }
}

std::size_t line_begin(const std::string& s, std::size_t off) {
  while (off > 0 && s[off - 1] != '\n') --off;
  return off;
}

// Start of a /** */ comment directly above the line at off, else off.
std::size_t attach_doc_comment(const std::string& src, std::size_t off) {
  std::size_t i = off;
  while (i > 0 && std::isspace((unsigned char)src[i - 1])) --i;
  if (i < 2 || src.compare(i - 2, 2, "*/") != 0) return off;
  std::size_t open = src.rfind("/*", i - 2);
  if (open == std::string::npos || src.compare(open, 3, "/**") != 0) return off;
  return line_begin(src, open);
}

} // namespace

std::vector<Chunk> WebScriptChunker::parse(const std::string& path, const std::string& content) const {
  static const RE2 function_re(
    R"((?m)^[ \t]*(?:export[ \t]+)?(?:default[ \t]+)?(?:declare[ \t]+)?(?:async[ \t]+)?function\*?[ \t]*([A-Za-z_$][\w$]*)[ \t]*(?:<[^>{]*>)?[ \t]*\()");
  static const RE2 class_re(
    R"((?m)^[ \t]*(?:export[ \t]+)?(?:default[ \t]+)?(?:abstract[ \t]+)?class[ \t]+([A-Za-z_$][\w$]*))");
  static const RE2 interface_re(
    R"((?m)^[ \t]*(?:export[ \t]+)?interface[ \t]+([A-Za-z_$][\w$]*))");
  static const RE2 arrow_re(
    R"((?m)^[ \t]*(?:export[ \t]+)?(?:const|let|var)[ \t]+([A-Za-z_$][\w$]*)[ \t]*(?::[^=\n]+)?=[ \t]*(?:async[ \t]+)?(?:\([^)]*\)|[A-Za-z_$][\w$]*)[ \t]*(?::[^=\n]+)?=>)");
  static const RE2 method_re(
    R"(^[ \t]+(?:(?:public|private|protected|static|async|readonly|override|abstract|get|set)[ \t]+)*\*?([A-Za-z_$#][\w$]*)[ \t]*(?:<[^>{]*>)?[ \t]*\()");
  static const std::set<std::string> not_methods = {
    "if", "for", "while", "switch", "catch", "return", "function", "with", "super", "new", "await", "typeof"};

  const std::string m = mask_source(content);
  TextLines lines(content);
  std::vector<Decl> decls;
  std::set<std::size_t> seen;

  auto add_block = [&](std::size_t decl_begin, std::size_t open, const std::string& name, const char* type) {
    if (open == std::string::npos) return;
    std::size_t close = match_close(m, open);
    if (close == std::string::npos) {
      spdlog::warn("{}: unbalanced braces in {} '{}' at line {}", path, type, name, lines.line_of(decl_begin));
      return;
    }
    std::size_t start = line_begin(content, decl_begin);
    if (!seen.insert(start).second) return;
    decls.push_back(Decl{start, close, name, type});
  };

  for_each_match(function_re, m, 0, m.size(), [&](std::size_t b, std::size_t e, std::string name) {
    std::size_t params_end = match_close(m, e - 1);
    if (params_end == std::string::npos) return;
    add_block(b, find_body_open(m, params_end), name, chunk_types::kFunction);
  });

  for_each_match(class_re, m, 0, m.size(), [&](std::size_t b, std::size_t e, std::string name) {
    std::size_t open = m.find('{', e);
    add_block(b, open, name, chunk_types::kClass);
    if (open == std::string::npos) return;
    std::size_t close = match_close(m, open);
    if (close == std::string::npos) return;

    // methods sit at depth 1 inside the class body
    int depth = 0;
    for (std::size_t i = open; i < close; ++i) {
      if (m[i] == '{') ++depth;
      else if (m[i] == '}') --depth;
      else if (m[i] == '\n' && depth == 1) {
        std::size_t eol = m.find('\n', i + 1);
        if (eol == std::string::npos || eol > close) eol = close;
        re2::StringPiece line(m.data() + i + 1, eol - i - 1);
        std::string mname;
        if (!RE2::PartialMatch(line, method_re, &mname) || not_methods.count(mname)) continue;
        std::size_t paren = m.find('(', i + 1);
        std::size_t params_end = paren == std::string::npos ? paren : match_close(m, paren);
        if (params_end == std::string::npos) continue;
        add_block(i + 1, find_body_open(m, params_end), mname, chunk_types::kMethod);
      }
    }
  });

  for_each_match(interface_re, m, 0, m.size(), [&](std::size_t b, std::size_t e, std::string name) {
    add_block(b, m.find('{', e), name, chunk_types::kInterface);
  });

  for_each_match(arrow_re, m, 0, m.size(), [&](std::size_t b, std::size_t e, std::string name) {
    std::size_t i = skip_ws(m, e);
    if (i < m.size() && m[i] == '{') {
      add_block(b, i, name, chunk_types::kFunction);
      return;
    }
    // expression body: runs to ';' or a newline at bracket depth zero
    int depth = 0;
    std::size_t end = i;
    for (; end < m.size(); ++end) {
      char c = m[end];
      if (c == '(' || c == '[' || c == '{') ++depth;
      else if (c == ')' || c == ']' || c == '}') { if (--depth < 0) break; }
      else if ((c == ';' || c == '\n') && depth == 0) break;
    }
    std::size_t start = line_begin(content, b);
    if (end > i && seen.insert(start).second) decls.push_back(Decl{start, end, name, chunk_types::kFunction});
  });

  std::vector<Chunk> chunks;
  chunks.reserve(decls.size());
  for (auto& d : decls) {
    std::size_t begin = attach_doc_comment(content, d.start);
    Chunk c;
    c.file = path;
    c.type = d.type;
    c.name = d.name;
    c.ls = lines.line_of(begin);
    c.le = lines.line_of(d.end > 0 ? d.end - 1 : 0);
    c.text = lines.slice(c.ls, c.le);
    chunks.push_back(std::move(c));
  }
  std::sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) {
    return a.ls != b.ls ? a.ls < b.ls : a.le > b.le;
  });
  return chunks;
}
