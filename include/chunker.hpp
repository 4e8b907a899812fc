#pragma once
#include "chunk.hpp"
#include "config.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

// Line-start offsets of a text, so spans can be turned into line numbers.
class TextLines {
public:
  explicit TextLines(const std::string& text);

  int count() const { return (int)starts_.size() - 1; }
  int line_of(std::size_t offset) const;              // 1-indexed
  std::size_t begin_of(int line) const { return starts_[line - 1]; }
  std::size_t end_of(int line) const { return starts_[line]; }  // past the '\n'
  std::string line(int n) const;                      // without the '\n'
  std::string slice(int ls, int le) const;            // lines ls..le, trailing '\n' trimmed

private:
  const std::string& text_;
  std::vector<std::size_t> starts_;  // starts_[i] = offset of line i+1, last = size
};

// One language family. Subclasses only parse; reading, size limits, the
// whole-file fallback and hashing are shared.
class Chunker {
public:
  explicit Chunker(std::size_t max_file_size) : max_file_size_(max_file_size) {}
  virtual ~Chunker() = default;

  virtual std::string name() const = 0;
  virtual std::set<std::string> supported_extensions() const = 0;

  // Chunks of the file at path in source order, each sealed. Oversized files
  // give an empty result (logged). Unreadable or unparsable files throw
  // ExtractionError. A non-blank file with no structure gives one chunk.
  std::vector<Chunk> extract_chunks(const std::string& path) const;

  // Same over in-memory content; no size limit.
  std::vector<Chunk> extract_from_text(const std::string& path, const std::string& content) const;

  std::size_t max_file_size() const { return max_file_size_; }

protected:
  virtual std::vector<Chunk> parse(const std::string& path, const std::string& content) const = 0;

private:
  std::size_t max_file_size_;
};

class PythonChunker : public Chunker {
public:
  explicit PythonChunker(const ExtractorConfig& cfg)
    : Chunker(cfg.max_file_size), include_comments_(cfg.python_include_comments) {}
  std::string name() const override { return "python"; }
  std::set<std::string> supported_extensions() const override { return {".py", ".pyi"}; }
protected:
  std::vector<Chunk> parse(const std::string& path, const std::string& content) const override;
private:
  bool include_comments_;
};

// TypeScript and JavaScript.
class WebScriptChunker : public Chunker {
public:
  explicit WebScriptChunker(const ExtractorConfig& cfg) : Chunker(cfg.max_file_size) {}
  std::string name() const override { return "webscript"; }
  std::set<std::string> supported_extensions() const override { return {".ts", ".tsx", ".js", ".jsx"}; }
protected:
  std::vector<Chunk> parse(const std::string& path, const std::string& content) const override;
};

class MarkdownChunker : public Chunker {
public:
  explicit MarkdownChunker(const ExtractorConfig& cfg)
    : Chunker(cfg.max_file_size), split_by_headings_(cfg.markdown_split_by_headings) {}
  std::string name() const override { return "markdown"; }
  std::set<std::string> supported_extensions() const override { return {".md", ".markdown"}; }
protected:
  std::vector<Chunk> parse(const std::string& path, const std::string& content) const override;
private:
  bool split_by_headings_;
};

enum class ExtractStatus { Ok, TooLarge, Unsupported };

struct ExtractResult {
  ExtractStatus status = ExtractStatus::Ok;
  std::vector<Chunk> chunks;
};

// Extension -> chunker lookup. Each extension belongs to one chunker.
class ChunkerRegistry {
public:
  // Throws ConfigurationError if an extension is already claimed.
  void add(std::shared_ptr<const Chunker> chunker);

  const Chunker* find(const std::string& path) const;  // nullptr if unclaimed
  bool supports(const std::string& path) const { return find(path) != nullptr; }
  std::set<std::string> extensions() const;

  // Dispatches to the claiming chunker. ExtractionError propagates.
  ExtractResult extract(const std::string& path) const;

private:
  std::map<std::string, std::shared_ptr<const Chunker>> by_ext_;
};

// Python, web script and markdown chunkers.
ChunkerRegistry make_default_registry(const ExtractorConfig& cfg);

// Lower-cased extension including the dot, "" if none.
std::string lower_extension(const std::string& path);
