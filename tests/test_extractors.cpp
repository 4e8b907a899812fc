#include "chunker.hpp"
#include "errors.hpp"
#include "filters.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <algorithm>

namespace {

const Chunk* find_chunk(const std::vector<Chunk>& chunks, const std::string& name) {
  auto it = std::find_if(chunks.begin(), chunks.end(), [&](const Chunk& c) { return c.name == name; });
  return it == chunks.end() ? nullptr : &*it;
}

const char* kPython =
  "\"\"\"Module doc.\"\"\"\n"        // 1
  "\n"                               // 2
  "import os\n"                      // 3
  "\n"                               // 4
  "@decorator\n"                     // 5
  "def top(a,\n"                     // 6
  "        b):\n"                    // 7
  "    return a + b\n"               // 8
  "\n"                               // 9
  "class Foo:\n"                     // 10
  "    def bar(self):\n"             // 11
  "        pass\n"                   // 12
  "\n"                               // 13
  "    async def baz(self):\n"       // 14
  "        pass\n";                  // 15

} // namespace

TEST(PythonChunker, FindsFunctionsClassesMethodsAndModuleDoc) {
  PythonChunker py{ExtractorConfig{}};
  auto chunks = py.extract_from_text("/src/mod.py", kPython);
  ASSERT_EQ(chunks.size(), 5u);

  const Chunk* doc = find_chunk(chunks, "mod.py:module");
  ASSERT_NE(doc, nullptr);
  EXPECT_EQ(doc->type, "module_doc");
  EXPECT_EQ(doc->ls, 1);
  EXPECT_EQ(doc->le, 1);

  const Chunk* top = find_chunk(chunks, "top");
  ASSERT_NE(top, nullptr);
  EXPECT_EQ(top->type, "function");
  EXPECT_EQ(top->ls, 5);  // decorator included
  EXPECT_EQ(top->le, 8);
  EXPECT_EQ(top->text.rfind("@decorator", 0), 0u);

  const Chunk* foo = find_chunk(chunks, "Foo");
  ASSERT_NE(foo, nullptr);
  EXPECT_EQ(foo->type, "class");
  EXPECT_EQ(foo->ls, 10);
  EXPECT_EQ(foo->le, 15);

  const Chunk* bar = find_chunk(chunks, "bar");
  ASSERT_NE(bar, nullptr);
  EXPECT_EQ(bar->type, "method");
  EXPECT_EQ(bar->ls, 11);
  EXPECT_EQ(bar->le, 12);

  const Chunk* baz = find_chunk(chunks, "baz");
  ASSERT_NE(baz, nullptr);
  EXPECT_EQ(baz->type, "method");
  EXPECT_EQ(baz->le, 15);

  for (const auto& c : chunks) {
    EXPECT_EQ(c.content_hash.size(), 64u) << c.name;
    EXPECT_LE(c.ls, c.le) << c.name;
    EXPECT_EQ(c.file, "/src/mod.py");
  }
}

TEST(PythonChunker, NestedFunctionIsAFunction) {
  PythonChunker py{ExtractorConfig{}};
  auto chunks = py.extract_from_text("/src/n.py",
    "def outer():\n"
    "    def inner():\n"
    "        return 1\n"
    "    return inner\n");
  const Chunk* inner = find_chunk(chunks, "inner");
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->type, "function");
  EXPECT_EQ(find_chunk(chunks, "outer")->le, 4);
}

TEST(PythonChunker, StripsCommentLinesWhenAsked) {
  ExtractorConfig cfg;
  cfg.python_include_comments = false;
  PythonChunker py{cfg};
  auto chunks = py.extract_from_text("/src/c.py",
    "def f():\n"
    "    # internal note\n"
    "    return 1\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text.find("internal note"), std::string::npos);
  EXPECT_NE(chunks[0].text.find("return 1"), std::string::npos);
}

TEST(PythonChunker, DefInsideDocstringIsIgnored) {
  PythonChunker py{ExtractorConfig{}};
  auto chunks = py.extract_from_text("/src/d.py",
    "def f():\n"
    "    \"\"\"Returns {\n"
    "def not_real():\n"
    "    \"\"\"\n"
    "    return 1\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].name, "f");
  EXPECT_EQ(chunks[0].le, 5);
}

TEST(PythonChunker, BackslashInCommentDoesNotJoinLines) {
  PythonChunker py{ExtractorConfig{}};
  auto chunks = py.extract_from_text("/src/io.py",
    "# files live under C:\\data\\\n"    // 1
    "def load(path):\n"                     // 2
    "    return open(path).read()\n"        // 3
    "\n"                                    // 4
    "def save(path, data):\n"               // 5
    "    open(path, 'w').write(data)\n");   // 6
  ASSERT_EQ(chunks.size(), 2u);

  const Chunk* load = find_chunk(chunks, "load");
  ASSERT_NE(load, nullptr);
  EXPECT_EQ(load->type, "function");
  EXPECT_EQ(load->ls, 2);
  EXPECT_EQ(load->le, 3);

  const Chunk* save = find_chunk(chunks, "save");
  ASSERT_NE(save, nullptr);
  EXPECT_EQ(save->ls, 5);
  EXPECT_EQ(save->le, 6);
}

TEST(Chunker, UnstructuredFileBecomesOneChunk) {
  PythonChunker py{ExtractorConfig{}};
  auto chunks = py.extract_from_text("/src/script.py", "import sys\nprint(sys.argv)\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].type, "other");
  EXPECT_EQ(chunks[0].name, "script.py");
  EXPECT_EQ(chunks[0].ls, 1);
  EXPECT_EQ(chunks[0].le, 2);
}

TEST(Chunker, BlankFileHasNoChunks) {
  PythonChunker py{ExtractorConfig{}};
  EXPECT_TRUE(py.extract_from_text("/src/empty.py", "  \n\n\t\n").empty());
}

TEST(WebScriptChunker, FindsDeclarations) {
  WebScriptChunker ts{ExtractorConfig{}};
  auto chunks = ts.extract_from_text("/src/shapes.ts",
    "/** Adds numbers. */\n"                                 // 1
    "export function add(a: number, b: number): number {\n"  // 2
    "  return a + b;\n"                                      // 3
    "}\n"                                                    // 4
    "\n"                                                     // 5
    "export interface Shape {\n"                             // 6
    "  area(): number;\n"                                    // 7
    "}\n"                                                    // 8
    "\n"                                                     // 9
    "export class Circle implements Shape {\n"               // 10
    "  constructor(private r: number) {}\n"                  // 11
    "\n"                                                     // 12
    "  area(): number {\n"                                   // 13
    "    const s = \"}{\";\n"                                // 14
    "    return Math.PI * this.r * this.r;\n"                // 15
    "  }\n"                                                  // 16
    "}\n"                                                    // 17
    "\n"                                                     // 18
    "const double = (x: number) => x * 2;\n");               // 19

  ASSERT_EQ(chunks.size(), 6u);

  const Chunk* add = find_chunk(chunks, "add");
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->type, "function");
  EXPECT_EQ(add->ls, 1);  // doc comment attached
  EXPECT_EQ(add->le, 4);
  EXPECT_EQ(add->text.rfind("/**", 0), 0u);

  const Chunk* shape = find_chunk(chunks, "Shape");
  ASSERT_NE(shape, nullptr);
  EXPECT_EQ(shape->type, "interface");
  EXPECT_EQ(shape->le, 8);

  const Chunk* circle = find_chunk(chunks, "Circle");
  ASSERT_NE(circle, nullptr);
  EXPECT_EQ(circle->type, "class");
  EXPECT_EQ(circle->ls, 10);
  EXPECT_EQ(circle->le, 17);

  const Chunk* area = find_chunk(chunks, "area");
  ASSERT_NE(area, nullptr);
  EXPECT_EQ(area->type, "method");
  EXPECT_EQ(area->ls, 13);
  EXPECT_EQ(area->le, 16);

  const Chunk* ctor = find_chunk(chunks, "constructor");
  ASSERT_NE(ctor, nullptr);
  EXPECT_EQ(ctor->type, "method");

  const Chunk* dbl = find_chunk(chunks, "double");
  ASSERT_NE(dbl, nullptr);
  EXPECT_EQ(dbl->type, "function");
  EXPECT_EQ(dbl->ls, 19);
  EXPECT_EQ(dbl->le, 19);

  // source order
  for (std::size_t i = 1; i < chunks.size(); ++i) EXPECT_LE(chunks[i - 1].ls, chunks[i].ls);
}

TEST(WebScriptChunker, UnbalancedBodyIsSkipped) {
  WebScriptChunker js{ExtractorConfig{}};
  auto chunks = js.extract_from_text("/src/broken.js",
    "function broken() {\n"
    "  if (x) {\n"
    "    return 1;\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].type, "other");
  EXPECT_EQ(chunks[0].name, "broken.js");
}

TEST(WebScriptChunker, BracesInRegexLiteralsDoNotCount) {
  WebScriptChunker js{ExtractorConfig{}};
  auto chunks = js.extract_from_text("/src/text.js",
    "function hasBrace(s) {\n"                        // 1
    "  return /[/{]/.test(s) || /{/.test(s);\n"       // 2
    "}\n"                                             // 3
    "\n"                                              // 4
    "function half(n) {\n"                            // 5
    "  return n / 2 / 1;\n"                           // 6
    "}\n");                                           // 7
  ASSERT_EQ(chunks.size(), 2u);

  const Chunk* has = find_chunk(chunks, "hasBrace");
  ASSERT_NE(has, nullptr);
  EXPECT_EQ(has->ls, 1);
  EXPECT_EQ(has->le, 3);

  const Chunk* half = find_chunk(chunks, "half");
  ASSERT_NE(half, nullptr);
  EXPECT_EQ(half->ls, 5);
  EXPECT_EQ(half->le, 7);
}

TEST(MarkdownChunker, SplitsByHeadingsOutsideFences) {
  MarkdownChunker md{ExtractorConfig{}};
  auto chunks = md.extract_from_text("/docs/guide.md",
    "Intro text.\n"        // 1
    "\n"                   // 2
    "# Title\n"            // 3
    "\n"                   // 4
    "Some words.\n"        // 5
    "\n"                   // 6
    "## Install\n"         // 7
    "\n"                   // 8
    "```bash\n"            // 9
    "# not a heading\n"    // 10
    "```\n"                // 11
    "\n"                   // 12
    "## Usage\n"           // 13
    "Run it.\n");          // 14

  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0].type, "other");
  EXPECT_EQ(chunks[0].name, "guide.md");
  EXPECT_EQ(chunks[0].le, 1);

  EXPECT_EQ(chunks[1].type, "heading_section");
  EXPECT_EQ(chunks[1].name, "Title");
  EXPECT_EQ(chunks[1].ls, 3);
  EXPECT_EQ(chunks[1].le, 5);

  EXPECT_EQ(chunks[2].name, "Install");
  EXPECT_EQ(chunks[2].ls, 7);
  EXPECT_EQ(chunks[2].le, 11);
  EXPECT_NE(chunks[2].text.find("# not a heading"), std::string::npos);

  EXPECT_EQ(chunks[3].name, "Usage");
  EXPECT_EQ(chunks[3].le, 14);
}

TEST(MarkdownChunker, ClosingHashesNeedLeadingSpace) {
  MarkdownChunker md{ExtractorConfig{}};
  auto chunks = md.extract_from_text("/docs/langs.md",
    "## C#\n"
    "\n"
    "Notes.\n"
    "\n"
    "## Setup ##\n"
    "\n"
    "Steps.\n");
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].name, "C#");
  EXPECT_EQ(chunks[0].le, 3);
  EXPECT_EQ(chunks[1].name, "Setup");
  EXPECT_EQ(chunks[1].ls, 5);
}

TEST(MarkdownChunker, WholeDocumentWhenNotSplitting) {
  ExtractorConfig cfg;
  cfg.markdown_split_by_headings = false;
  MarkdownChunker md{cfg};
  auto chunks = md.extract_from_text("/docs/a.md", "# One\ntext\n# Two\nmore\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].type, "other");
  EXPECT_EQ(chunks[0].le, 4);
}

namespace {

class PyClaimer : public Chunker {
public:
  PyClaimer() : Chunker(1024) {}
  std::string name() const override { return "claimer"; }
  std::set<std::string> supported_extensions() const override { return {".py"}; }
protected:
  std::vector<Chunk> parse(const std::string&, const std::string&) const override { return {}; }
};

} // namespace

TEST(ChunkerRegistry, RejectsExtensionClaimedTwice) {
  ChunkerRegistry reg = make_default_registry(ExtractorConfig{});
  EXPECT_THROW(reg.add(std::make_shared<PyClaimer>()), ConfigurationError);
  EXPECT_TRUE(reg.supports("/x/Y.PY"));
  EXPECT_FALSE(reg.supports("/x/y.rs"));
}

TEST(ChunkerRegistry, ReportsOversizedAndUnsupportedFiles) {
  TempDir tmp;
  ExtractorConfig cfg;
  cfg.max_file_size = 16;
  ChunkerRegistry reg = make_default_registry(cfg);

  write_file(tmp.path / "big.py", "def f():\n    return 'this file is longer than sixteen bytes'\n");
  write_file(tmp.path / "small.py", "x = 1\n");
  write_file(tmp.path / "notes.txt", "hello\n");

  EXPECT_EQ(reg.extract(tmp.str("big.py")).status, ExtractStatus::TooLarge);
  EXPECT_EQ(reg.extract(tmp.str("notes.txt")).status, ExtractStatus::Unsupported);

  auto small = reg.extract(tmp.str("small.py"));
  EXPECT_EQ(small.status, ExtractStatus::Ok);
  EXPECT_EQ(small.chunks.size(), 1u);
}

TEST(ChunkerRegistry, MissingFileIsAnExtractionError) {
  ChunkerRegistry reg = make_default_registry(ExtractorConfig{});
  EXPECT_THROW(reg.extract("/definitely/not/here.py"), ExtractionError);
}

TEST(PathFilter, MatchesGlobsOnComponentsAndNames) {
  PathFilter f({".git", "node_*"}, {"*.pyc", "secret?.txt"});
  EXPECT_TRUE(f.excluded_dir(".git"));
  EXPECT_TRUE(f.excluded_dir("node_modules"));
  EXPECT_FALSE(f.excluded_dir("src"));
  EXPECT_TRUE(f.excluded_file("a.pyc"));
  EXPECT_TRUE(f.excluded_file("secret1.txt"));
  EXPECT_FALSE(f.excluded_file("secret12.txt"));
  EXPECT_TRUE(f.excluded_path("lib/node_modules/x.js"));
  EXPECT_FALSE(f.excluded_path("lib/src/x.js"));
}

TEST(PathFilter, ListsOnlyIncludedSourceFiles) {
  TempDir tmp;
  write_file(tmp.path / "a.py", "x = 1\n");
  write_file(tmp.path / "b.pyc", "");
  write_file(tmp.path / "docs" / "c.md", "# c\n");
  write_file(tmp.path / "node_modules" / "d.js", "function d() {}\n");
  write_file(tmp.path / "e.txt", "e\n");

  PathFilter f({"node_modules"}, {"*.pyc"});
  auto files = list_source_files(tmp.str(), f, {".py", ".md", ".js", ".pyc"});
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0], tmp.str("a.py"));
  EXPECT_EQ(files[1], (tmp.path / "docs" / "c.md").string());
}
