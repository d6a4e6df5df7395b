#include <codecheck/errors.h>
#include <codecheck/file_analyzer.h>
#include <codecheck/fingerprint.h>

#include <gtest/gtest.h>

#include <string>
#include <utility>

namespace codecheck {
namespace {

constexpr char kSource[] = "// header\n"
                           "class Counter {\n"
                           "  void bump() { ++count_; }\n"
                           "  int count_ = 0;\n"
                           "};\n"
                           "\n"
                           "int twice(int value) {\n"
                           "  return value * 2;\n"
                           "}\n";

ParsedUnit Function(std::string name, std::string qualname, int first,
                    int last, UnitKind kind = UnitKind::kFunction) {
  ParsedUnit unit;
  unit.kind = kind;
  unit.name = std::move(name);
  unit.qualname = std::move(qualname);
  unit.lineno = first;
  unit.end_lineno = last;
  unit.parameters = 1;
  unit.syntax = {SyntaxKind::kFunctionDefinition, SyntaxKind::kReturn,
                 SyntaxKind::kExpression};
  return unit;
}

ParsedFile MakeParsedFile() {
  ParsedUnit type;
  type.kind = UnitKind::kClass;
  type.name = "Counter";
  type.qualname = "Counter";
  type.lineno = 2;
  type.end_lineno = 5;
  type.docstring = "Counts things.";
  type.methods.push_back(
      Function("bump", "Counter.bump", 3, 3, UnitKind::kMethod));

  ParsedFile file;
  file.path = "/project/src/counter.cpp";
  file.source = kSource;
  file.units.push_back(std::move(type));
  file.units.push_back(Function("twice", "twice", 7, 9));
  return file;
}

TEST(SliceLinesTest, KeepsLineEndings) {
  EXPECT_EQ("b\nc\n", SliceLines("a\nb\nc\nd", 2, 3));
  EXPECT_EQ("d", SliceLines("a\nb\nc\nd", 4, 9));
  EXPECT_EQ("", SliceLines("a\n", 3, 4));
}

TEST(FileAnalyzerTest, BuildsFileClassMethodHierarchy) {
  const auto node = AnalyzeFile(MakeParsedFile());

  EXPECT_EQ(NodeType::kFile, node.Type());
  EXPECT_EQ("counter.cpp", node.name);
  EXPECT_EQ("/project/src/counter.cpp", node.path);
  ASSERT_EQ(2u, node.children.size());

  const auto &type = node.children[0];
  EXPECT_EQ(NodeType::kClass, type.Type());
  EXPECT_EQ("Counts things.", type.Docstring());
  EXPECT_FALSE(type.IsLeaf());
  ASSERT_NE(nullptr, type.Span());
  EXPECT_EQ(2, type.Span()->lineno);
  ASSERT_EQ(1u, type.children.size());
  EXPECT_EQ(NodeType::kMethod, type.children[0].Type());
  EXPECT_EQ("Counter.bump", type.children[0].qualname);
  EXPECT_EQ("  void bump() { ++count_; }\n", type.children[0].Leaf().source);

  const auto &function = node.children[1];
  EXPECT_EQ(NodeType::kFunction, function.Type());
  EXPECT_EQ("twice", function.qualname);
}

TEST(FileAnalyzerTest, LeafCarriesMetricsAndSource) {
  const auto node = AnalyzeFile(MakeParsedFile());
  const auto &leaf = node.children[1].Leaf();

  EXPECT_EQ(3, leaf.metrics.lines);
  EXPECT_EQ(2, leaf.metrics.statements);
  EXPECT_EQ(1, leaf.metrics.expressions);
  EXPECT_EQ(1, leaf.metrics.cyclomatic_complexity);
  EXPECT_EQ(1, leaf.metrics.parameters);
  EXPECT_EQ("int twice(int value) {\n  return value * 2;\n}\n", leaf.source);
  // No tokens from the front-end.
  EXPECT_TRUE(leaf.fingerprint.empty());
}

TEST(FileAnalyzerTest, FingerprintsTheUnitTokens) {
  auto file = MakeParsedFile();
  auto &unit = file.units[1];
  for (int i = 0; i < 30; ++i) {
    unit.tokens.push_back("t" + std::to_string(i));
  }

  const auto node = AnalyzeFile(file);

  EXPECT_EQ(ComputeFingerprint(unit.tokens),
            node.children[1].Leaf().fingerprint);
  EXPECT_FALSE(node.children[1].Leaf().fingerprint.empty());
}

TEST(FileAnalyzerTest, QualifiedNameFallsBackToName) {
  const auto node = AnalyzeFunction(Function("solo", "", 7, 9), "/x.cpp",
                                    kSource);

  EXPECT_EQ("solo", node.qualname);
}

TEST(FileAnalyzerTest, RejectsClassUnitsAsFunctions) {
  ParsedUnit type;
  type.kind = UnitKind::kClass;
  type.name = "Counter";

  EXPECT_THROW(AnalyzeFunction(type, "/x.cpp", kSource), InvariantViolation);
}

} // namespace
} // namespace codecheck
