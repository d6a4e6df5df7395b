#pragma once

#include <codecheck/models.h>

#include <vector>

namespace codecheck {

bool IsStatement(SyntaxKind kind);
bool IsDecision(SyntaxKind kind);
bool IsExpression(SyntaxKind kind);

class MetricCounter {
public:
  void Visit(SyntaxKind kind);
  void VisitAll(const std::vector<SyntaxKind> &stream);

  int statements() const { return statements_; }
  int expressions() const { return expressions_; }
  int expression_statements() const { return expression_statements_; }
  // McCabe approximation: decision points plus one for the entry.
  int cyclomatic_complexity() const { return decision_points_ + 1; }

private:
  int statements_ = 0;
  int expressions_ = 0;
  int expression_statements_ = 0;
  int decision_points_ = 0;
};

Metrics ExtractMetrics(const ParsedUnit &unit);

} // namespace codecheck
