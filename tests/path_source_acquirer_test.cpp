#include <codecheck/path_source_acquirer.h>

#include "test_support/temporary_project.h"

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace codecheck {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using test::TemporaryProject;

TEST(PathSourceAcquirerTest, WalksDirectoriesRecursivelyInSortedOrder) {
  TemporaryProject project;
  const auto b = project.AddFile("src/b.cpp", "int b();");
  const auto a = project.AddFile("src/a.cc", "int a();");
  const auto nested = project.AddFile("src/util/c.hpp", "int c();");
  project.AddFile("src/README.md", "docs");

  AnalysisConfig config;
  config.paths = {project.root().string()};
  const auto result = PathSourceAcquirer().Acquire(config);

  EXPECT_THAT(result.files,
              ElementsAre(a.string(), b.string(), nested.string()));
  EXPECT_TRUE(result.skipped.empty());
}

TEST(PathSourceAcquirerTest, DeduplicatesOverlappingInputs) {
  TemporaryProject project;
  const auto file = project.AddFile("pkg/m.cpp", "int m();");

  AnalysisConfig config;
  config.paths = {file.string(), project.root().string(),
                  (project.root() / "pkg" / ".." / "pkg").string()};
  const auto result = PathSourceAcquirer().Acquire(config);

  EXPECT_THAT(result.files, ElementsAre(file.string()));
}

TEST(PathSourceAcquirerTest, DoesNotFollowSymlinksDuringTheWalk) {
  TemporaryProject project;
  const auto real = project.AddFile("real/m.cpp", "int m();");
  project.AddSymlink("tree/linked.cpp", real);
  project.AddSymlink("tree/linked_dir", project.root() / "real");
  const auto own = project.AddFile("tree/own.cpp", "int own();");

  AnalysisConfig config;
  config.paths = {(project.root() / "tree").string()};
  const auto result = PathSourceAcquirer().Acquire(config);

  EXPECT_THAT(result.files, ElementsAre(own.string()));
}

TEST(PathSourceAcquirerTest, HonoursIgnoredPaths) {
  TemporaryProject project;
  const auto kept = project.AddFile("src/main.cpp", "int main();");
  const auto generated = project.AddFile("src/gen/table.cpp", "int t();");
  project.AddFile("build/out.cpp", "int o();");

  AnalysisConfig config;
  config.paths = {project.root().string(), generated.string()};
  config.ignored_paths = {(project.root() / "build").string(),
                          (project.root() / "src" / "gen").string()};
  const auto result = PathSourceAcquirer().Acquire(config);

  EXPECT_THAT(result.files, ElementsAre(kept.string()));
}

TEST(PathSourceAcquirerTest, SkipsUnusableInputsWithAWarning) {
  TemporaryProject project;
  const auto notes = project.AddFile("notes.txt", "hello");
  const auto source = project.AddFile("lib.c", "int f(void);");
  const auto missing = project.root() / "missing.cpp";

  std::ostringstream log;
  PathSourceAcquirer acquirer(
      std::make_shared<StructuredLogger>(log, LoggingConfig{LogLevel::kWarn}));
  AnalysisConfig config;
  config.paths = {notes.string(), missing.string(), source.string()};
  const auto result = acquirer.Acquire(config);

  EXPECT_THAT(result.files, ElementsAre(source.string()));
  EXPECT_THAT(result.skipped, ElementsAre(notes.string(), missing.string()));
  EXPECT_THAT(log.str(), HasSubstr("message=\"input.skipped\""));
  EXPECT_THAT(log.str(), HasSubstr(notes.string()));
}

TEST(PathSourceAcquirerTest, ContinuesPastUnreadableDirectories) {
  TemporaryProject project;
  const auto readable = project.AddFile("src/a.cpp", "int a();");
  project.AddFile("src/locked/b.cpp", "int b();");
  const auto locked = project.root() / "src" / "locked";
  std::filesystem::permissions(locked, std::filesystem::perms::none);

  AnalysisConfig config;
  config.paths = {project.root().string()};
  SourceAcquisitionResult result;
  EXPECT_NO_THROW(result = PathSourceAcquirer().Acquire(config));
  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

  EXPECT_THAT(result.files, Contains(readable.string()));
}

TEST(PathSourceAcquirerTest, RecognisesCAndCppExtensions) {
  EXPECT_TRUE(IsSourceExtension("a.c"));
  EXPECT_TRUE(IsSourceExtension("dir/a.cpp"));
  EXPECT_TRUE(IsSourceExtension("a.cxx"));
  EXPECT_TRUE(IsSourceExtension("a.h"));
  EXPECT_TRUE(IsSourceExtension("a.hpp"));
  EXPECT_FALSE(IsSourceExtension("a.py"));
  EXPECT_FALSE(IsSourceExtension("a.cpp.orig"));
  EXPECT_FALSE(IsSourceExtension("Makefile"));
}

} // namespace
} // namespace codecheck
