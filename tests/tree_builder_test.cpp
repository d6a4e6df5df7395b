#include <codecheck/tree_builder.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codecheck {
namespace {

ReportNode File(const std::string &path) {
  return MakeFileNode(path.substr(path.rfind('/') + 1), path);
}

std::vector<std::string> ChildNames(const ReportNode &node) {
  std::vector<std::string> names;
  for (const auto &child : node.children) {
    names.push_back(child.name);
  }
  return names;
}

const ReportNode &Descend(const ReportNode &node,
                          const std::vector<std::string> &names) {
  const ReportNode *current = &node;
  for (const auto &name : names) {
    const ReportNode *next = nullptr;
    for (const auto &child : current->children) {
      if (child.name == name) {
        next = &child;
        break;
      }
    }
    if (next == nullptr) {
      throw std::runtime_error("missing child " + name);
    }
    current = next;
  }
  return *current;
}

TEST(TreeBuilderTest, CreatesSyntheticRoot) {
  const auto root = BuildTree({}, "/work");

  EXPECT_EQ(kRootNodeName, root.name);
  EXPECT_EQ("/work", root.path);
  EXPECT_TRUE(root.IsDirectory());
  EXPECT_TRUE(root.children.empty());
}

TEST(TreeBuilderTest, SharesDirectoryNodesAndKeepsEncounterOrder) {
  std::vector<ReportNode> files;
  files.push_back(File("/codecheck-none/src/b.cpp"));
  files.push_back(File("/codecheck-none/src/a.cpp"));

  const auto root = BuildTree(std::move(files), "/work");

  const auto &src = Descend(root, {"/", "codecheck-none", "src"});
  EXPECT_EQ(std::vector<std::string>({"b.cpp", "a.cpp"}), ChildNames(src));
  EXPECT_EQ("/codecheck-none/src", src.path);
  EXPECT_EQ(1u, Descend(root, {"/", "codecheck-none"}).children.size());
}

TEST(TreeBuilderTest, AppendsDirectoriesInEncounterOrder) {
  std::vector<ReportNode> files;
  files.push_back(File("/codecheck-none/zeta/z.cpp"));
  files.push_back(File("/codecheck-none/alpha/a.cpp"));
  files.push_back(File("/codecheck-none/zeta/y.cpp"));

  const auto root = BuildTree(std::move(files), "/work");

  const auto &project = Descend(root, {"/", "codecheck-none"});
  EXPECT_EQ(std::vector<std::string>({"zeta", "alpha"}), ChildNames(project));
  EXPECT_EQ(std::vector<std::string>({"z.cpp", "y.cpp"}),
            ChildNames(project.children[0]));
}

TEST(TreePrunerTest, StopsAtFirstDirectoryWithFiles) {
  std::vector<ReportNode> files;
  files.push_back(File("/codecheck-none/a/b/pkg/m.cpp"));

  const auto pruned = PruneTree(BuildTree(std::move(files), "/work"));

  EXPECT_EQ("pkg", pruned.name);
  EXPECT_EQ(std::vector<std::string>({"m.cpp"}), ChildNames(pruned));
}

TEST(TreePrunerTest, StopsAtFirstBranchingDirectory) {
  std::vector<ReportNode> files;
  files.push_back(File("/codecheck-none/repo/lib/x.cpp"));
  files.push_back(File("/codecheck-none/repo/app/main.cpp"));

  const auto pruned = PruneTree(BuildTree(std::move(files), "/work"));

  EXPECT_EQ("repo", pruned.name);
  EXPECT_FALSE(pruned.HasFileChildren());
  EXPECT_EQ(std::vector<std::string>({"lib", "app"}), ChildNames(pruned));
}

TEST(TreePrunerTest, IsIdempotent) {
  std::vector<ReportNode> files;
  files.push_back(File("/codecheck-none/a/b/one.cpp"));
  files.push_back(File("/codecheck-none/a/b/c/two.cpp"));

  const auto once = PruneTree(BuildTree(std::move(files), "/work"));
  const auto twice = PruneTree(once);

  EXPECT_EQ("b", once.name);
  EXPECT_EQ(once.name, twice.name);
  EXPECT_EQ(once.path, twice.path);
  EXPECT_EQ(ChildNames(once), ChildNames(twice));
}

TEST(TreePrunerTest, LeavesNonDirectoryRootAlone) {
  auto file = MakeFileNode("m.cpp", "/m.cpp");

  EXPECT_EQ("m.cpp", PruneTree(file).name);
}

} // namespace
} // namespace codecheck
