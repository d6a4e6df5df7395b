#include <codecheck/json_reporter.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>

namespace codecheck {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

ReportNode MakeLeafNode() {
  FunctionPayload leaf;
  leaf.span = {3, 4};
  leaf.docstring = "Adds \"one\".";
  leaf.metrics.lines = 2;
  leaf.metrics.statements = 2;
  leaf.metrics.expressions = 3;
  leaf.metrics.cyclomatic_complexity = 1;
  leaf.metrics.parameters = 1;
  leaf.source = "int inc(int v) {\n  return v + 1; }\n";
  leaf.fingerprint = {12345678901234ULL};

  ReportNode node;
  node.name = "inc";
  node.path = "/p/m.cpp";
  node.qualname = "inc";
  node.payload = std::move(leaf);
  return node;
}

TEST(FormatScoreTest, UsesAtMostThreeDecimals) {
  EXPECT_EQ("0.987", FormatScore(0.987));
  EXPECT_EQ("1.0", FormatScore(1.0));
  EXPECT_EQ("0.5", FormatScore(0.5));
  EXPECT_EQ("0.0", FormatScore(0.0));
}

TEST(JsonReporterTest, RendersDirectoryWithNullMetricsAndSpan) {
  auto root = MakeDirectoryNode("pkg", "/p");

  EXPECT_EQ("{\n"
            "  \"name\": \"pkg\",\n"
            "  \"nodetype\": \"directory\",\n"
            "  \"path\": \"/p\",\n"
            "  \"qualname\": \"\",\n"
            "  \"lineno\": null,\n"
            "  \"end_lineno\": null,\n"
            "  \"docstring\": \"\",\n"
            "  \"metrics\": null,\n"
            "  \"source\": \"\",\n"
            "  \"children\": []\n"
            "}\n",
            JsonReporter().Render(root));
}

TEST(JsonReporterTest, RendersLeafMetricsInFieldOrder) {
  auto file = MakeFileNode("m.cpp", "/p/m.cpp");
  file.children.push_back(MakeLeafNode());

  const auto json = JsonReporter().Render(file);

  EXPECT_THAT(json, HasSubstr("\"nodetype\": \"function\""));
  EXPECT_THAT(json, HasSubstr("\"lineno\": 3,\n"));
  EXPECT_THAT(json, HasSubstr("\"docstring\": \"Adds \\\"one\\\".\""));
  EXPECT_THAT(json, HasSubstr("\"source\": \"int inc(int v) {\\n  return v "
                              "+ 1; }\\n\""));
  EXPECT_THAT(json, HasSubstr("\"metrics\": {\n"
                              "        \"lines\": 2,\n"
                              "        \"statements\": 2,\n"
                              "        \"expressions\": 3,\n"
                              "        \"expression_statements\": 0,\n"
                              "        \"cyclomatic_complexity\": 1,\n"
                              "        \"parameters\": 1,\n"
                              "        \"duplication\": null\n"
                              "      }"));
  EXPECT_LT(json.find("\"name\""), json.find("\"nodetype\""));
  EXPECT_LT(json.find("\"metrics\": {"), json.find("\"source\": \"int"));
}

TEST(JsonReporterTest, RendersDuplicationRecord) {
  auto leaf = MakeLeafNode();
  leaf.AttachDuplication({0.991, "Other.inc", 5});

  const auto json = JsonReporter().Render(leaf);

  EXPECT_THAT(json, HasSubstr("\"duplication\": {\n"
                              "      \"score\": 0.991,\n"
                              "      \"other\": \"Other.inc\",\n"
                              "      \"lines_other\": 5\n"
                              "    }"));
}

TEST(JsonReporterTest, NeverRendersFingerprint) {
  const auto json = JsonReporter().Render(MakeLeafNode());

  EXPECT_THAT(json, Not(HasSubstr("fingerprint")));
  EXPECT_THAT(json, Not(HasSubstr("12345678901234")));
}

} // namespace
} // namespace codecheck
