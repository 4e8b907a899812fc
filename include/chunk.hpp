#pragma once
#include <string>

// Open set: chunkers may emit other labels, these are the ones shipped.
namespace chunk_types {
inline const char* const kFunction       = "function";
inline const char* const kMethod         = "method";
inline const char* const kClass          = "class";
inline const char* const kInterface      = "interface";
inline const char* const kModuleDoc      = "module_doc";
inline const char* const kHeadingSection = "heading_section";
inline const char* const kOther          = "other";
}

struct Chunk {
  std::string file;         // absolute path
  std::string type;         // see chunk_types
  std::string name;         // symbol or heading, may be empty
  std::string text;         // embedded and displayed
  int ls = 0;               // line start, 1-indexed
  int le = 0;               // line end, inclusive
  std::string content_hash; // sha256(text), hex
};

// Fills content_hash from text.
void seal_chunk(Chunk& c);
