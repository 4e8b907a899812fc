#include "config.hpp"
#include "errors.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>

namespace {

// Sets an environment variable for the life of the object.
struct ScopedEnv {
  std::string name;
  ScopedEnv(const std::string& n, const std::string& v) : name(n) { ::setenv(n.c_str(), v.c_str(), 1); }
  ~ScopedEnv() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST(Config, Defaults) {
  Config c = config_from_json_text("", false);
  EXPECT_EQ(c.index_name, "default");
  EXPECT_EQ(c.retriever.top_k, 75);
  EXPECT_DOUBLE_EQ(c.retriever.threshold, 0.35);
  EXPECT_EQ(c.vector_index.metric, "cosine");
  EXPECT_EQ(c.embedder.batch_size, 32);
  EXPECT_TRUE(c.embedder.use_cache);
  EXPECT_EQ(c.extractors.max_file_size, 1024u * 1024u);
  EXPECT_NE(std::find(c.indexing.exclude_dirs.begin(), c.indexing.exclude_dirs.end(), ".git"),
            c.indexing.exclude_dirs.end());
}

TEST(Config, ShippedDefaultFileMatchesBuiltins) {
  Config file = load_config(std::string(CCR_SOURCE_DIR) + "/config/default_config.json");
  Config builtin;
  EXPECT_EQ(file.index_name, builtin.index_name);
  EXPECT_EQ(file.embedder.model, builtin.embedder.model);
  EXPECT_EQ(file.retriever.top_k, builtin.retriever.top_k);
  EXPECT_DOUBLE_EQ(file.retriever.threshold, builtin.retriever.threshold);
  EXPECT_EQ(file.retriever.format_template, builtin.retriever.format_template);
  EXPECT_EQ(file.vector_index.ef_search, builtin.vector_index.ef_search);
  EXPECT_EQ(file.indexing.exclude_files, builtin.indexing.exclude_files);
}

TEST(Config, FileValuesMergeOverDefaults) {
  Config c = config_from_json_text(R"({"retriever": {"top_k": 10}, "vector_index": {"metric": "l2"}})", false);
  EXPECT_EQ(c.retriever.top_k, 10);
  EXPECT_DOUBLE_EQ(c.retriever.threshold, 0.35);
  EXPECT_EQ(c.vector_index.metric, "l2");
  EXPECT_EQ(c.vector_index.hnsw_m, 16);
}

TEST(Config, EnvironmentOverridesFile) {
  ScopedEnv k("CCR_RETRIEVER_TOP_K", "12");
  ScopedEnv m("CCR_EMBEDDER_MODEL", "hashing/64");
  ScopedEnv d("CCR_INDEXING_EXCLUDE_DIRS", R"(["build"])");

  Config c = config_from_json_text(R"({"retriever": {"top_k": 10}})");
  EXPECT_EQ(c.retriever.top_k, 12);
  EXPECT_EQ(c.embedder.model, "hashing/64");
  EXPECT_EQ(c.indexing.exclude_dirs, std::vector<std::string>{"build"});

  Config no_env = config_from_json_text(R"({"retriever": {"top_k": 10}})", false);
  EXPECT_EQ(no_env.retriever.top_k, 10);
}

TEST(Config, UnknownKeysAreIgnored) {
  Config c = config_from_json_text(R"({"colour": "blue", "retriever": {"top_k": 5, "rerank": true}})", false);
  EXPECT_EQ(c.retriever.top_k, 5);
}

TEST(Config, InvalidValuesAreRejected) {
  const char* bad[] = {
    R"({"vector_index": {"metric": "dot"}})",
    R"({"retriever": {"threshold": 1.5}})",
    R"({"retriever": {"threshold": -0.1}})",
    R"({"retriever": {"top_k": 0}})",
    R"({"retriever": {"top_k": "many"}})",
    R"({"retriever": {"format_template": "{file} {nope}"}})",
    R"({"embedder": {"batch_size": 0}})",
    R"({"logging": {"level": "loud"}})",
    R"({"index_name": ""})",
    R"([1, 2, 3])",
    R"({"retriever": )",
  };
  for (const char* text : bad) {
    EXPECT_THROW(config_from_json_text(text, false), ConfigurationError) << text;
  }
}

TEST(Config, LoadsFromFile) {
  TempDir tmp;
  write_file(tmp.path / "ccr.json", R"({"index_name": "demo", "embedder": {"model": "hashing"}})");
  Config c = load_config(tmp.str("ccr.json"));
  EXPECT_EQ(c.index_name, "demo");
  EXPECT_EQ(c.embedder.model, "hashing");

  EXPECT_THROW(load_config(tmp.str("missing.json")), ConfigurationError);
}
