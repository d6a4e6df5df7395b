#include <codecheck/json_reporter.h>

#include <codecheck/escaping.h>

#include <cstdio>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace codecheck {

namespace {

using JsonMembers = std::vector<std::pair<std::string, std::string>>;

constexpr char kNull[] = "null";

std::string Indent(int depth) {
  return std::string(static_cast<std::size_t>(depth) * 2, ' ');
}

std::string RenderObject(const JsonMembers &members, int depth) {
  if (members.empty()) {
    return "{}";
  }
  std::ostringstream json;
  json << "{\n";
  for (std::size_t i = 0; i < members.size(); ++i) {
    json << Indent(depth + 1) << QuoteJson(members[i].first) << ": "
         << members[i].second;
    json << (i + 1 < members.size() ? ",\n" : "\n");
  }
  json << Indent(depth) << "}";
  return json.str();
}

std::string RenderArray(const std::vector<std::string> &items, int depth) {
  if (items.empty()) {
    return "[]";
  }
  std::ostringstream json;
  json << "[\n";
  for (std::size_t i = 0; i < items.size(); ++i) {
    json << Indent(depth + 1) << items[i];
    json << (i + 1 < items.size() ? ",\n" : "\n");
  }
  json << Indent(depth) << "]";
  return json.str();
}

std::string RenderDuplication(const std::optional<Duplication> &duplication,
                              int depth) {
  if (!duplication) {
    return kNull;
  }
  return RenderObject(
      {{"score", FormatScore(duplication->score)},
       {"other", QuoteJson(duplication->other)},
       {"lines_other", std::to_string(duplication->lines_other)}},
      depth);
}

std::string RenderMetrics(const Metrics &metrics, int depth) {
  return RenderObject(
      {{"lines", std::to_string(metrics.lines)},
       {"statements", std::to_string(metrics.statements)},
       {"expressions", std::to_string(metrics.expressions)},
       {"expression_statements",
        std::to_string(metrics.expression_statements)},
       {"cyclomatic_complexity",
        std::to_string(metrics.cyclomatic_complexity)},
       {"parameters", std::to_string(metrics.parameters)},
       {"duplication", RenderDuplication(metrics.duplication, depth + 1)}},
      depth);
}

std::string RenderNode(const ReportNode &node, int depth) {
  const auto *span = node.Span();
  const bool leaf = node.IsLeaf();

  std::vector<std::string> children;
  children.reserve(node.children.size());
  for (const auto &child : node.children) {
    children.push_back(RenderNode(child, depth + 2));
  }

  return RenderObject(
      {{"name", QuoteJson(node.name)},
       {"nodetype", QuoteJson(NodeTypeName(node.Type()))},
       {"path", QuoteJson(node.path)},
       {"qualname", QuoteJson(node.qualname)},
       {"lineno", span != nullptr ? std::to_string(span->lineno) : kNull},
       {"end_lineno",
        span != nullptr ? std::to_string(span->end_lineno) : kNull},
       {"docstring", QuoteJson(node.Docstring())},
       {"metrics", leaf ? RenderMetrics(node.Leaf().metrics, depth + 1)
                        : std::string(kNull)},
       {"source", QuoteJson(leaf ? node.Leaf().source : std::string{})},
       {"children", RenderArray(children, depth + 1)}},
      depth);
}

} // namespace

std::string FormatScore(double score) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.3f", score);
  std::string text(buffer);
  while (text.size() > 1 && text.back() == '0' &&
         text[text.size() - 2] != '.') {
    text.pop_back();
  }
  return text;
}

std::string JsonReporter::Render(const ReportNode &root) {
  return RenderNode(root, 0) + "\n";
}

} // namespace codecheck
