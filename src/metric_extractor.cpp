#include <codecheck/metric_extractor.h>

namespace codecheck {

bool IsStatement(SyntaxKind kind) {
  switch (kind) {
  case SyntaxKind::kFunctionDefinition:
  case SyntaxKind::kClassDefinition:
  case SyntaxKind::kConditional:
  case SyntaxKind::kForLoop:
  case SyntaxKind::kWhileLoop:
  case SyntaxKind::kContextManager:
  case SyntaxKind::kTryBlock:
  case SyntaxKind::kExceptionHandler:
  case SyntaxKind::kPatternMatch:
  case SyntaxKind::kAssignment:
  case SyntaxKind::kAugmentedAssignment:
  case SyntaxKind::kAnnotatedAssignment:
  case SyntaxKind::kRaise:
  case SyntaxKind::kReturn:
    return true;
  default:
    return false;
  }
}

bool IsDecision(SyntaxKind kind) {
  switch (kind) {
  case SyntaxKind::kConditional:
  case SyntaxKind::kForLoop:
  case SyntaxKind::kWhileLoop:
  case SyntaxKind::kTryBlock:
  case SyntaxKind::kExceptionHandler:
  case SyntaxKind::kContextManager:
  case SyntaxKind::kPatternMatch:
  case SyntaxKind::kBooleanOperator:
    return true;
  default:
    return false;
  }
}

bool IsExpression(SyntaxKind kind) {
  return kind == SyntaxKind::kExpression ||
         kind == SyntaxKind::kBooleanOperator;
}

void MetricCounter::Visit(SyntaxKind kind) {
  if (IsStatement(kind)) {
    ++statements_;
  }
  if (IsDecision(kind)) {
    ++decision_points_;
  }
  if (kind == SyntaxKind::kExpressionStatement) {
    ++expression_statements_;
  }
  if (IsExpression(kind)) {
    ++expressions_;
  }
}

void MetricCounter::VisitAll(const std::vector<SyntaxKind> &stream) {
  for (const auto kind : stream) {
    Visit(kind);
  }
}

Metrics ExtractMetrics(const ParsedUnit &unit) {
  MetricCounter counter;
  counter.VisitAll(unit.syntax);

  Metrics metrics;
  metrics.lines = unit.end_lineno - unit.lineno + 1;
  metrics.statements = counter.statements();
  metrics.expressions = counter.expressions();
  metrics.expression_statements = counter.expression_statements();
  metrics.cyclomatic_complexity = counter.cyclomatic_complexity();
  metrics.parameters = unit.parameters;
  return metrics;
}

} // namespace codecheck
