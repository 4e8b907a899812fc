#include "chunker.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

TextLines::TextLines(const std::string& text) : text_(text) {
  starts_.push_back(0);
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n' && i + 1 < text.size()) starts_.push_back(i + 1);
  }
  // sentinel; an empty text has no lines at all
  if (!text.empty()) starts_.push_back(text.size());
}

int TextLines::line_of(std::size_t offset) const {
  auto it = std::upper_bound(starts_.begin(), starts_.end() - 1, offset);
  return std::max(1, (int)(it - starts_.begin()));
}

std::string TextLines::line(int n) const {
  std::string s = text_.substr(begin_of(n), end_of(n) - begin_of(n));
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

std::string TextLines::slice(int ls, int le) const {
  std::string s = text_.substr(begin_of(ls), end_of(le) - begin_of(ls));
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

std::string lower_extension(const std::string& path) {
  auto ext = fs::path(path).extension().string();
  for (auto& c : ext) c = (char)std::tolower((unsigned char)c);
  return ext;
}

static bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::vector<Chunk> Chunker::extract_from_text(const std::string& path, const std::string& content) const {
  if (is_blank(content)) return {};

  std::vector<Chunk> chunks = parse(path, content);
  if (chunks.empty()) {
    TextLines lines(content);
    Chunk whole;
    whole.file = path;
    whole.type = chunk_types::kOther;
    whole.name = fs::path(path).filename().string();
    whole.text = content;
    whole.ls = 1;
    whole.le = std::max(1, lines.count());
    chunks.push_back(std::move(whole));
  }
  for (auto& c : chunks) seal_chunk(c);
  return chunks;
}

std::vector<Chunk> Chunker::extract_chunks(const std::string& path) const {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec) throw ExtractionError(path, ec.message());
  if (size > max_file_size_) {
    spdlog::warn("skipping {}: {} bytes exceeds max_file_size {}", path, size, max_file_size_);
    return {};
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) throw ExtractionError(path, "cannot open");
  std::string data;
  {
    std::ostringstream ss; ss << in.rdbuf(); data = ss.str();
  }

  auto chunks = extract_from_text(path, data);
  spdlog::debug("{}: {} chunks from {}", name(), chunks.size(), path);
  return chunks;
}

void ChunkerRegistry::add(std::shared_ptr<const Chunker> chunker) {
  for (auto& ext : chunker->supported_extensions()) {
    auto it = by_ext_.find(ext);
    if (it != by_ext_.end()) {
      throw ConfigurationError("extension " + ext + " claimed by both " +
                               it->second->name() + " and " + chunker->name());
    }
  }
  for (auto& ext : chunker->supported_extensions()) by_ext_[ext] = chunker;
}

const Chunker* ChunkerRegistry::find(const std::string& path) const {
  auto it = by_ext_.find(lower_extension(path));
  return it == by_ext_.end() ? nullptr : it->second.get();
}

std::set<std::string> ChunkerRegistry::extensions() const {
  std::set<std::string> out;
  for (auto& kv : by_ext_) out.insert(kv.first);
  return out;
}

ExtractResult ChunkerRegistry::extract(const std::string& path) const {
  ExtractResult r;
  const Chunker* c = find(path);
  if (!c) {
    r.status = ExtractStatus::Unsupported;
    return r;
  }
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (!ec && size > c->max_file_size()) {
    spdlog::warn("skipping {}: {} bytes exceeds max_file_size {}", path, size, c->max_file_size());
    r.status = ExtractStatus::TooLarge;
    return r;
  }
  r.chunks = c->extract_chunks(path);
  return r;
}

ChunkerRegistry make_default_registry(const ExtractorConfig& cfg) {
  ChunkerRegistry reg;
  reg.add(std::make_shared<PythonChunker>(cfg));
  reg.add(std::make_shared<WebScriptChunker>(cfg));
  reg.add(std::make_shared<MarkdownChunker>(cfg));
  return reg;
}
