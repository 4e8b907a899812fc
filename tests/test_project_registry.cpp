#include "errors.hpp"
#include "projects.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <cstdlib>

TEST(ProjectRegistry, SetWithDirectoryCreatesAndSelects) {
  TempDir home, repo;
  ProjectRegistry reg(home.str());
  Project p = reg.set("demo", repo.str());
  EXPECT_EQ(p.name, "demo");
  EXPECT_EQ(p.directory, repo.str());
  EXPECT_EQ(p.index_name, "demo");
  EXPECT_TRUE(p.config_path.empty());

  auto cur = reg.current();
  ASSERT_TRUE(cur.has_value());
  EXPECT_EQ(cur->name, "demo");
}

TEST(ProjectRegistry, SetUnknownWithoutDirectoryFails) {
  TempDir home, repo;
  ProjectRegistry reg(home.str());
  reg.set("demo", repo.str());

  EXPECT_THROW(reg.set("other-name"), ProjectNotFoundError);
  ASSERT_TRUE(reg.current().has_value());
  EXPECT_EQ(reg.current()->name, "demo");
  EXPECT_FALSE(reg.get("other-name").has_value());
}

TEST(ProjectRegistry, SetExistingWithoutDirectorySwitches) {
  TempDir home, a, b;
  ProjectRegistry reg(home.str());
  reg.set("a", a.str());
  reg.set("b", b.str());
  EXPECT_EQ(reg.current()->name, "b");
  reg.set("a");
  EXPECT_EQ(reg.current()->name, "a");
  EXPECT_EQ(reg.current()->directory, a.str());
}

TEST(ProjectRegistry, AddDoesNotSwitchAndRejectsDuplicates) {
  TempDir home, a, b;
  ProjectRegistry reg(home.str());
  reg.set("a", a.str());
  reg.add("b", b.str());
  EXPECT_EQ(reg.current()->name, "a");
  EXPECT_THROW(reg.add("b", a.str()), ProjectAlreadyExistsError);
  EXPECT_EQ(reg.get("b")->directory, b.str());
}

TEST(ProjectRegistry, MissingPathsAreInvalid) {
  TempDir home, repo;
  ProjectRegistry reg(home.str());
  EXPECT_THROW(reg.set("x", repo.str("nope")), std::invalid_argument);
  EXPECT_THROW(reg.add("x", repo.str(), repo.str("missing.json")), std::invalid_argument);
  EXPECT_TRUE(reg.list().empty());
}

TEST(ProjectRegistry, ConfigPathIsKept) {
  TempDir home, repo;
  write_file(repo.path / "ccr.json", "{}");
  ProjectRegistry reg(home.str());
  reg.set("demo", repo.str(), repo.str("ccr.json"));
  EXPECT_EQ(reg.current()->config_path, repo.str("ccr.json"));
}

TEST(ProjectRegistry, RemoveClearsCurrent) {
  TempDir home, a, b;
  ProjectRegistry reg(home.str());
  reg.add("a", a.str());
  reg.set("b", b.str());

  reg.remove("a");
  EXPECT_EQ(reg.current()->name, "b");
  reg.remove("b");
  EXPECT_FALSE(reg.current().has_value());
  EXPECT_THROW(reg.remove("b"), ProjectNotFoundError);

  ProjectRegistry again(home.str());
  EXPECT_FALSE(again.current().has_value());
  EXPECT_TRUE(again.list().empty());
}

TEST(ProjectRegistry, PersistsAcrossInstances) {
  TempDir home, a, b;
  {
    ProjectRegistry reg(home.str());
    reg.add("zeta", a.str());
    reg.set("alpha", b.str());
  }
  ProjectRegistry reg(home.str());
  auto all = reg.list();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].name, "alpha");
  EXPECT_EQ(all[1].name, "zeta");
  EXPECT_EQ(reg.current()->name, "alpha");
}

TEST(ProjectRegistry, Resolve) {
  TempDir home, a, b;
  ProjectRegistry reg(home.str());
  EXPECT_FALSE(reg.resolve().has_value());

  reg.add("a", a.str());
  reg.set("b", b.str());
  EXPECT_EQ(reg.resolve()->name, "b");
  EXPECT_EQ(reg.resolve("a")->name, "a");
  EXPECT_THROW(reg.resolve("c"), ProjectNotFoundError);
}

TEST(ProjectRegistry, HomeFromEnvironment) {
  TempDir home;
  ::setenv("CCR_HOME", home.str().c_str(), 1);
  EXPECT_EQ(ProjectRegistry::default_home(), home.str());
  ProjectRegistry reg;
  EXPECT_EQ(reg.home(), home.str());
  ::unsetenv("CCR_HOME");
}
