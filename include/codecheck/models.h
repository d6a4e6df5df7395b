#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace codecheck {

enum class NodeType { kDirectory, kFile, kClass, kFunction, kMethod };

std::string NodeTypeName(NodeType type);

// Syntax categories a front-end reports for the nodes inside one unit.
enum class SyntaxKind {
  kFunctionDefinition,
  kClassDefinition,
  kConditional,
  kForLoop,
  kWhileLoop,
  kContextManager,
  kTryBlock,
  kExceptionHandler,
  kPatternMatch,
  kAssignment,
  kAugmentedAssignment,
  kAnnotatedAssignment,
  kRaise,
  kReturn,
  kExpressionStatement,
  kBooleanOperator,
  kExpression,
  kOther
};

enum class UnitKind { kClass, kFunction, kMethod };

struct ParsedUnit {
  UnitKind kind = UnitKind::kFunction;
  std::string name;
  std::string qualname;
  int lineno = 0;
  int end_lineno = 0;
  std::string docstring;
  int parameters = 0;
  // Pre-order, starting with the unit's own definition header.
  std::vector<SyntaxKind> syntax;
  // Front-end tokens of the unit without comments; literals are replaced by
  // NormalizeLiteral placeholders.
  std::vector<std::string> tokens;
  std::vector<ParsedUnit> methods;
};

struct ParsedFile {
  std::string path;
  std::string source;
  std::vector<ParsedUnit> units;
};

struct Duplication {
  double score = 0.0;
  std::string other;
  int lines_other = 0;
};

struct Metrics {
  int lines = 0;
  int statements = 0;
  int expressions = 0;
  int expression_statements = 0;
  int cyclomatic_complexity = 1;
  int parameters = 0;
  std::optional<Duplication> duplication;

  Metrics WithDuplication(Duplication record) const;
};

using Fingerprint = std::set<std::uint64_t>;

struct SourceSpan {
  int lineno = 0;
  int end_lineno = 0;
};

struct DirectoryPayload {};

struct FilePayload {};

struct ClassPayload {
  SourceSpan span;
  std::string docstring;
};

struct LeafPayload {
  SourceSpan span;
  std::string docstring;
  Metrics metrics;
  std::string source;
  Fingerprint fingerprint;
};

struct FunctionPayload : LeafPayload {};

struct MethodPayload : LeafPayload {};

using NodePayload = std::variant<DirectoryPayload, FilePayload, ClassPayload,
                                 FunctionPayload, MethodPayload>;

struct ReportNode {
  std::string name;
  std::string path;
  std::string qualname;
  NodePayload payload;
  std::vector<ReportNode> children;

  NodeType Type() const;
  bool IsDirectory() const { return Type() == NodeType::kDirectory; }
  bool IsLeaf() const;
  bool HasFileChildren() const;

  // Throws InvariantViolation on non-leaf nodes.
  const LeafPayload &Leaf() const;
  const SourceSpan *Span() const;
  const std::string &Docstring() const;

  void AttachDuplication(Duplication record);
};

ReportNode MakeDirectoryNode(std::string name, std::string path);
ReportNode MakeFileNode(std::string name, std::string path);

} // namespace codecheck
