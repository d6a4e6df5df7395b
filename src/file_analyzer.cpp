#include <codecheck/file_analyzer.h>

#include <codecheck/errors.h>
#include <codecheck/fingerprint.h>
#include <codecheck/metric_extractor.h>

#include <filesystem>
#include <utility>

namespace codecheck {

std::string SliceLines(std::string_view text, int first_line, int last_line) {
  std::string slice;
  int line = 1;
  std::size_t start = 0;
  while (start < text.size() && line <= last_line) {
    auto end = text.find('\n', start);
    end = end == std::string_view::npos ? text.size() : end + 1;
    if (line >= first_line) {
      slice.append(text.substr(start, end - start));
    }
    start = end;
    ++line;
  }
  return slice;
}

ReportNode AnalyzeFunction(const ParsedUnit &unit, const std::string &path,
                           std::string_view file_source) {
  if (unit.kind == UnitKind::kClass) {
    throw InvariantViolation("class '" + unit.name +
                             "' analysed as a function");
  }

  LeafPayload leaf;
  leaf.span = {unit.lineno, unit.end_lineno};
  leaf.docstring = unit.docstring;
  leaf.metrics = ExtractMetrics(unit);
  leaf.source = SliceLines(file_source, unit.lineno, unit.end_lineno);
  leaf.fingerprint = ComputeFingerprint(unit.tokens);

  ReportNode node;
  node.name = unit.name;
  node.path = path;
  node.qualname = unit.qualname.empty() ? unit.name : unit.qualname;
  if (unit.kind == UnitKind::kMethod) {
    node.payload = MethodPayload{std::move(leaf)};
  } else {
    node.payload = FunctionPayload{std::move(leaf)};
  }
  return node;
}

ReportNode AnalyzeClass(const ParsedUnit &unit, const std::string &path,
                        std::string_view file_source) {
  ReportNode node;
  node.name = unit.name;
  node.path = path;
  node.payload = ClassPayload{{unit.lineno, unit.end_lineno}, unit.docstring};
  node.children.reserve(unit.methods.size());
  for (const auto &method : unit.methods) {
    node.children.push_back(AnalyzeFunction(method, path, file_source));
  }
  return node;
}

ReportNode AnalyzeFile(const ParsedFile &file) {
  auto node = MakeFileNode(std::filesystem::path(file.path).filename().string(),
                           file.path);
  node.children.reserve(file.units.size());
  for (const auto &unit : file.units) {
    if (unit.kind == UnitKind::kClass) {
      node.children.push_back(AnalyzeClass(unit, file.path, file.source));
    } else {
      node.children.push_back(AnalyzeFunction(unit, file.path, file.source));
    }
  }
  return node;
}

} // namespace codecheck
