#include "chunker.hpp"
#include "errors.hpp"
#include "pipeline.hpp"
#include "project_index.hpp"
#include "query.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <memory>

namespace {

struct Indexed {
  TempDir tmp;
  Config cfg = test_config(tmp);
  std::shared_ptr<EmbeddingBackend> backend = std::make_shared<HashingBackend>(1024);

  Indexed() {
    cfg.embedder.model = "hashing/1024";
    write_file(tmp.path / "src" / "auth.py",
      "def login(user, pwd):\n"
      "    \"\"\"How authentication is implemented.\"\"\"\n"
      "    return verify(user, pwd)\n");
    write_file(tmp.path / "src" / "math.py",
      "def add(a, b):\n"
      "    return a + b\n");
    write_file(tmp.path / "src" / "dup_a.py", "def same():\n    return 1\n");
    write_file(tmp.path / "src" / "dup_b.py", "def same():\n    return 1\n");

    ChunkerRegistry registry = make_default_registry(cfg.extractors);
    Embedder embedder(backend, nullptr, cfg.embedder);
    ProjectIndex project(cfg.vector_index, cfg.index_name);
    IndexingPipeline pipeline(cfg, registry, embedder, project);
    IndexOptions opts;
    opts.root = tmp.str("src");
    pipeline.run(opts);
  }

  std::string src(const std::string& rel) const { return (tmp.path / "src" / rel).string(); }
};

} // namespace

TEST(QueryEngine, FindsTheAuthenticationFunction) {
  Indexed ix;
  Embedder embedder(ix.backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  QueryEngine engine(ix.cfg.retriever, embedder, project);

  auto results = engine.query("How authentication is implemented", 75, 0.35);
  ASSERT_EQ(results.size(), 1u);
  const ScoredChunk& top = results[0];
  EXPECT_EQ(top.chunk.file, ix.src("auth.py"));
  EXPECT_EQ(top.chunk.name, "login");
  EXPECT_EQ(top.chunk.type, "function");
  EXPECT_GE(top.score, 0.35f);
  EXPECT_LE(top.score, 1.0f);

  const std::string head = "File: " + ix.src("auth.py") + " | Type: function | Name: login\nScore: ";
  EXPECT_EQ(top.rendered.rfind(head, 0), 0u);
  EXPECT_NE(top.rendered.find("return verify(user, pwd)"), std::string::npos);
}

TEST(QueryEngine, ZeroThresholdReturnsTopK) {
  Indexed ix;
  Embedder embedder(ix.backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  QueryEngine engine(ix.cfg.retriever, embedder, project);

  EXPECT_EQ(engine.query("return", 2, 0.0).size(), 2u);
  auto all = engine.query("return", 10, 0.0);
  ASSERT_EQ(all.size(), 4u);
  for (std::size_t i = 1; i < all.size(); ++i) EXPECT_GE(all[i - 1].score, all[i].score);
}

TEST(QueryEngine, ThresholdOfOneFiltersEverything) {
  Indexed ix;
  Embedder embedder(ix.backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  QueryEngine engine(ix.cfg.retriever, embedder, project);
  EXPECT_TRUE(engine.query("authentication", 10, 1.0).empty());
}

TEST(QueryEngine, ThresholdOfOneKeepsAnExactMatch) {
  Indexed ix;
  Embedder embedder(ix.backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  QueryEngine engine(ix.cfg.retriever, embedder, project);

  // the full text of the add chunk
  auto results = engine.query("def add(a, b):\n    return a + b", 10, 1.0);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.file, ix.src("math.py"));
  EXPECT_EQ(results[0].chunk.name, "add");
  EXPECT_FLOAT_EQ(results[0].score, 1.0f);
}

TEST(QueryEngine, EqualScoresOrderByFile) {
  Indexed ix;
  Embedder embedder(ix.backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  QueryEngine engine(ix.cfg.retriever, embedder, project);

  auto results = engine.query("same", 2, 0.1);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_FLOAT_EQ(results[0].score, results[1].score);
  EXPECT_EQ(results[0].chunk.file, ix.src("dup_a.py"));
  EXPECT_EQ(results[1].chunk.file, ix.src("dup_b.py"));
}

TEST(QueryEngine, RejectsBadArguments) {
  Indexed ix;
  auto backend = std::make_shared<CountingBackend>(1024);
  Embedder embedder(backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  QueryEngine engine(ix.cfg.retriever, embedder, project);

  EXPECT_THROW(engine.query("x", 0, 0.5), ConfigurationError);
  EXPECT_THROW(engine.query("x", -3, 0.5), ConfigurationError);
  EXPECT_THROW(engine.query("x", 5, 1.5), ConfigurationError);
  EXPECT_THROW(engine.query("x", 5, -0.1), ConfigurationError);
  EXPECT_THROW(engine.query("", 5, 0.5), std::invalid_argument);
  // nothing was embedded for rejected queries
  EXPECT_EQ(backend->calls, 0);
}

TEST(QueryEngine, CustomTemplate) {
  Indexed ix;
  Embedder embedder(ix.backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  RetrieverConfig rc = ix.cfg.retriever;
  rc.format_template = "{name}@{start_line}-{end_line}";
  QueryEngine engine(rc, embedder, project);

  auto results = engine.query("authentication", 1, 0.0);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].rendered, "login@1-3");
}

TEST(QueryEngine, BadTemplateIsAConfigurationError) {
  Indexed ix;
  Embedder embedder(ix.backend, nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  RetrieverConfig rc = ix.cfg.retriever;
  rc.format_template = "{file} {no_such_field}";
  EXPECT_THROW({ QueryEngine engine(rc, embedder, project); }, ConfigurationError);
}

TEST(QueryEngine, EmptyIndexGivesNoResults) {
  TempDir tmp;
  Config cfg = test_config(tmp);
  Embedder embedder(std::make_shared<HashingBackend>(256), nullptr, cfg.embedder);
  ProjectIndex project(cfg.vector_index, "never_indexed");
  QueryEngine engine(cfg.retriever, embedder, project);
  EXPECT_TRUE(engine.query("anything", 5, 0.0).empty());
}

TEST(QueryEngine, ModelMismatchIsAConfigurationError) {
  Indexed ix;
  Embedder embedder(std::make_shared<HashingBackend>(512), nullptr, ix.cfg.embedder);
  ProjectIndex project(ix.cfg.vector_index, ix.cfg.index_name);
  QueryEngine engine(ix.cfg.retriever, embedder, project);
  EXPECT_THROW(engine.query("authentication", 5, 0.0), ConfigurationError);
}

TEST(QueryOutput, JsonAndText) {
  ScoredChunk r;
  r.record_id = 4;
  r.chunk.file = "/src/auth.py";
  r.chunk.type = "function";
  r.chunk.name = "login";
  r.chunk.text = "def login(): pass";
  r.chunk.ls = 3;
  r.chunk.le = 4;
  r.score = 0.5f;
  r.rendered = render_chunk("{name} {score:.2f}", "--", r.chunk, r.score);
  EXPECT_EQ(r.rendered, "login 0.50");

  auto j = results_to_json({r});
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["file"], "/src/auth.py");
  EXPECT_EQ(j[0]["name"], "login");
  EXPECT_EQ(j[0]["start_line"], 3);
  EXPECT_EQ(j[0]["end_line"], 4);
  EXPECT_EQ(j[0]["text"], "def login(): pass");
  EXPECT_NEAR(j[0]["score"].get<double>(), 0.5, 1e-6);

  EXPECT_EQ(results_to_text("who logs in", {r}), "Results for query: who logs in\n\nResult 1:\nlogin 0.50\n\n");
  EXPECT_EQ(results_to_text("nothing", {}), "Results for query: nothing\n\n");
}

TEST(QueryOutput, InvalidUtf8IsReplacedInJson) {
  ScoredChunk r;
  r.chunk.file = "/src/menu.py";
  r.chunk.type = "function";
  r.chunk.name = "menu";
  r.chunk.text = "print('caf\xE9')";
  r.chunk.ls = 1;
  r.chunk.le = 1;
  r.score = 0.75f;

  std::string body;
  ASSERT_NO_THROW(body = format_results("menu", {r}, true));
  ASSERT_FALSE(body.empty());
  EXPECT_EQ(body.back(), '\n');
  auto j = nlohmann::json::parse(body);
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["text"], "print('caf\xEF\xBF\xBD')");
  EXPECT_EQ(j[0]["name"], "menu");

  r.rendered = "menu";
  EXPECT_EQ(format_results("menu", {r}, false), results_to_text("menu", {r}));
}
