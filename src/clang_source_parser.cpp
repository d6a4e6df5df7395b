#include <codecheck/clang_source_parser.h>

#include <codecheck/errors.h>
#include <codecheck/escaping.h>
#include <codecheck/fingerprint.h>

#include <clang-c/Index.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace codecheck {
namespace {

using IndexHandle = std::unique_ptr<void, decltype(&clang_disposeIndex)>;
using TranslationUnitHandle =
    std::unique_ptr<std::remove_pointer_t<CXTranslationUnit>,
                    decltype(&clang_disposeTranslationUnit)>;

constexpr char kParseIssueCategory[] = "Parse Issue";

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

std::string Trim(const std::string &value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

bool StartsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

std::string StripCommentMarkers(std::string line) {
  line = Trim(line);
  static const char *const kOpeners[] = {"///<", "//!<", "///", "//!", "//",
                                         "/**<", "/*!<", "/**", "/*!", "/*"};
  for (const auto *opener : kOpeners) {
    if (StartsWith(line, opener)) {
      line.erase(0, std::char_traits<char>::length(opener));
      break;
    }
  }
  if (EndsWith(line, "*/")) {
    line.erase(line.size() - 2);
  }
  line = Trim(line);
  if (StartsWith(line, "*")) {
    line.erase(0, 1);
  }
  return Trim(line);
}

std::string ReadSource(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw ParseError(path, "unable to open file");
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return ReplaceInvalidUtf8(buffer.str());
}

bool IsClassCursor(CXCursorKind kind) {
  switch (kind) {
  case CXCursor_ClassDecl:
  case CXCursor_StructDecl:
  case CXCursor_UnionDecl:
  case CXCursor_ClassTemplate:
  case CXCursor_ClassTemplatePartialSpecialization:
    return true;
  default:
    return false;
  }
}

bool IsFunctionCursor(CXCursorKind kind) {
  switch (kind) {
  case CXCursor_FunctionDecl:
  case CXCursor_FunctionTemplate:
  case CXCursor_CXXMethod:
  case CXCursor_Constructor:
  case CXCursor_Destructor:
  case CXCursor_ConversionFunction:
    return true;
  default:
    return false;
  }
}

bool IsTransparentScope(CXCursorKind kind) {
  return kind == CXCursor_Namespace || kind == CXCursor_LinkageSpec ||
         kind == CXCursor_UnexposedDecl;
}

bool IsFromMainFile(CXCursor cursor) {
  return clang_Location_isFromMainFile(clang_getCursorLocation(cursor)) != 0;
}

template <typename Visitor> void VisitChildren(CXCursor cursor, Visitor visit) {
  clang_visitChildren(
      cursor,
      [](CXCursor child, CXCursor, CXClientData data) {
        (*static_cast<Visitor *>(data))(child);
        return CXChildVisit_Continue;
      },
      &visit);
}

std::pair<int, int> LineSpan(CXCursor cursor) {
  const auto range = clang_getCursorExtent(cursor);
  unsigned start_line = 0;
  unsigned end_line = 0;
  clang_getExpansionLocation(clang_getRangeStart(range), nullptr, &start_line,
                             nullptr, nullptr);
  clang_getExpansionLocation(clang_getRangeEnd(range), nullptr, &end_line,
                             nullptr, nullptr);
  return {static_cast<int>(start_line),
          static_cast<int>(std::max(start_line, end_line))};
}

std::string CursorName(CXCursor cursor) {
  return ToString(clang_getCursorSpelling(cursor));
}

unsigned FileOffset(CXSourceLocation location) {
  unsigned offset = 0;
  clang_getFileLocation(location, nullptr, nullptr, nullptr, &offset);
  return offset;
}

// Owns the tokens libclang produced for one source range.
class TokenSet {
public:
  TokenSet(CXTranslationUnit translation_unit, CXSourceRange range)
      : translation_unit_(translation_unit) {
    clang_tokenize(translation_unit_, range, &tokens_, &count_);
  }
  ~TokenSet() {
    if (tokens_ != nullptr) {
      clang_disposeTokens(translation_unit_, tokens_, count_);
    }
  }
  TokenSet(const TokenSet &) = delete;
  TokenSet &operator=(const TokenSet &) = delete;

  unsigned size() const { return count_; }
  CXTokenKind Kind(unsigned index) const {
    return clang_getTokenKind(tokens_[index]);
  }
  std::string Spelling(unsigned index) const {
    return ToString(clang_getTokenSpelling(translation_unit_, tokens_[index]));
  }
  unsigned Offset(unsigned index) const {
    return FileOffset(clang_getRangeStart(
        clang_getTokenExtent(translation_unit_, tokens_[index])));
  }

private:
  CXTranslationUnit translation_unit_;
  CXToken *tokens_ = nullptr;
  unsigned count_ = 0;
};

TokenSet CursorTokens(CXCursor cursor) {
  return TokenSet(clang_Cursor_getTranslationUnit(cursor),
                  clang_getCursorExtent(cursor));
}

std::vector<CXCursor> Children(CXCursor cursor) {
  std::vector<CXCursor> children;
  VisitChildren(cursor,
                [&children](CXCursor child) { children.push_back(child); });
  return children;
}

unsigned CursorOffset(CXCursor cursor) {
  return FileOffset(clang_getRangeStart(clang_getCursorExtent(cursor)));
}

// The operator token is the first token after the left operand.
std::string BinaryOperatorSpelling(CXCursor cursor) {
  const auto children = Children(cursor);
  if (children.empty()) {
    return {};
  }
  const auto lhs_end =
      FileOffset(clang_getRangeEnd(clang_getCursorExtent(children.front())));

  const auto tokens = CursorTokens(cursor);
  for (unsigned i = 0; i < tokens.size(); ++i) {
    if (tokens.Offset(i) >= lhs_end) {
      return tokens.Spelling(i);
    }
  }
  return {};
}

// Offset of the ')' closing the first parenthesis of a statement, i.e. the
// end of an if/for/while header.
std::optional<unsigned> HeaderEnd(CXCursor statement) {
  const auto tokens = CursorTokens(statement);
  int depth = 0;
  for (unsigned i = 0; i < tokens.size(); ++i) {
    if (tokens.Kind(i) != CXToken_Punctuation) {
      continue;
    }
    const auto spelling = tokens.Spelling(i);
    if (spelling == "(") {
      ++depth;
    } else if (spelling == ")" && --depth == 0) {
      return tokens.Offset(i);
    }
  }
  return std::nullopt;
}

// A DeclStmt holding nothing but a class definition.
bool DeclaresOnlyRecord(CXCursor declaration) {
  const auto children = Children(declaration);
  if (children.size() != 1) {
    return false;
  }
  switch (clang_getCursorKind(children.front())) {
  case CXCursor_ClassDecl:
  case CXCursor_StructDecl:
  case CXCursor_UnionDecl:
    return clang_isCursorDefinition(children.front()) != 0;
  default:
    return false;
  }
}

std::vector<std::string> UnitTokens(CXCursor unit) {
  const auto tokens = CursorTokens(unit);
  std::vector<std::string> normalized;
  normalized.reserve(tokens.size());
  for (unsigned i = 0; i < tokens.size(); ++i) {
    switch (tokens.Kind(i)) {
    case CXToken_Comment:
      break;
    case CXToken_Literal:
      normalized.push_back(NormalizeLiteral(tokens.Spelling(i)));
      break;
    default:
      normalized.push_back(tokens.Spelling(i));
      break;
    }
  }
  return normalized;
}

// Pre-order syntax stream of one unit body.
class SyntaxCollector {
public:
  std::vector<SyntaxKind> Collect(CXCursor unit) {
    syntax_.clear();
    syntax_.push_back(SyntaxKind::kFunctionDefinition);
    VisitChildren(unit, [this](CXCursor child) { Traverse(child, false); });
    return std::move(syntax_);
  }

private:
  static std::optional<SyntaxKind> Classify(CXCursor cursor) {
    const auto kind = clang_getCursorKind(cursor);
    switch (kind) {
    case CXCursor_LambdaExpr:
      return SyntaxKind::kFunctionDefinition;
    case CXCursor_ClassDecl:
    case CXCursor_StructDecl:
    case CXCursor_UnionDecl:
      if (clang_isCursorDefinition(cursor)) {
        return SyntaxKind::kClassDefinition;
      }
      return std::nullopt;
    case CXCursor_IfStmt:
      return SyntaxKind::kConditional;
    case CXCursor_ForStmt:
    case CXCursor_CXXForRangeStmt:
      return SyntaxKind::kForLoop;
    case CXCursor_WhileStmt:
    case CXCursor_DoStmt:
      return SyntaxKind::kWhileLoop;
    case CXCursor_CXXTryStmt:
      return SyntaxKind::kTryBlock;
    case CXCursor_CXXCatchStmt:
      return SyntaxKind::kExceptionHandler;
    case CXCursor_SwitchStmt:
      return SyntaxKind::kPatternMatch;
    case CXCursor_CompoundAssignOperator:
      return SyntaxKind::kAugmentedAssignment;
    case CXCursor_DeclStmt:
      if (DeclaresOnlyRecord(cursor)) {
        return std::nullopt;
      }
      return SyntaxKind::kAnnotatedAssignment;
    case CXCursor_CXXThrowExpr:
      return SyntaxKind::kRaise;
    case CXCursor_ReturnStmt:
      return SyntaxKind::kReturn;
    case CXCursor_BinaryOperator: {
      const auto op = BinaryOperatorSpelling(cursor);
      if (op == "=") {
        return SyntaxKind::kAssignment;
      }
      if (op == "&&" || op == "||" || op == "and" || op == "or") {
        return SyntaxKind::kBooleanOperator;
      }
      return SyntaxKind::kExpression;
    }
    case CXCursor_UnexposedExpr:
      return std::nullopt;
    default:
      break;
    }
    if (clang_isExpression(kind)) {
      return SyntaxKind::kExpression;
    }
    if (clang_isStatement(kind) && kind != CXCursor_UnexposedStmt) {
      return SyntaxKind::kOther;
    }
    return std::nullopt;
  }

  static bool IsPlainExpression(SyntaxKind kind) {
    return kind == SyntaxKind::kExpression ||
           kind == SyntaxKind::kBooleanOperator ||
           kind == SyntaxKind::kFunctionDefinition;
  }

  // Which children of a cursor stand where a statement is expected.
  static std::vector<bool>
  StatementPositions(CXCursor cursor, const std::vector<CXCursor> &children,
                     bool statement_position) {
    std::vector<bool> positions(children.size(), false);
    switch (clang_getCursorKind(cursor)) {
    case CXCursor_CompoundStmt:
      positions.assign(children.size(), true);
      break;
    // Wrappers such as ExprWithCleanups hand their position to the wrapped
    // expression.
    case CXCursor_UnexposedExpr:
      positions.assign(children.size(), statement_position);
      break;
    case CXCursor_IfStmt:
    case CXCursor_ForStmt:
    case CXCursor_CXXForRangeStmt:
    case CXCursor_WhileStmt:
      if (const auto header_end = HeaderEnd(cursor)) {
        for (std::size_t i = 0; i < children.size(); ++i) {
          positions[i] = CursorOffset(children[i]) > *header_end;
        }
      }
      break;
    case CXCursor_DoStmt:
      if (!children.empty()) {
        positions.front() = true;
      }
      break;
    case CXCursor_CaseStmt:
    case CXCursor_DefaultStmt:
    case CXCursor_LabelStmt:
      if (!children.empty()) {
        positions.back() = true;
      }
      break;
    default:
      break;
    }
    return positions;
  }

  void Traverse(CXCursor cursor, bool statement_position) {
    const auto kind = clang_getCursorKind(cursor);
    if (const auto classified = Classify(cursor)) {
      if (statement_position && clang_isExpression(kind) &&
          IsPlainExpression(*classified)) {
        syntax_.push_back(SyntaxKind::kExpressionStatement);
      }
      syntax_.push_back(*classified);
    }
    const auto children = Children(cursor);
    const auto positions =
        StatementPositions(cursor, children, statement_position);
    for (std::size_t i = 0; i < children.size(); ++i) {
      Traverse(children[i], positions[i]);
    }
  }

  std::vector<SyntaxKind> syntax_;
};

int CountParameters(CXCursor function) {
  int count = 0;
  VisitChildren(function, [&count](CXCursor child) {
    if (clang_getCursorKind(child) == CXCursor_ParmDecl) {
      ++count;
    }
  });
  return count;
}

std::string EnclosingClassName(CXCursor cursor) {
  const auto parent = clang_getCursorSemanticParent(cursor);
  if (clang_Cursor_isNull(parent) ||
      !IsClassCursor(clang_getCursorKind(parent))) {
    return {};
  }
  return CursorName(parent);
}

ParsedUnit MakeUnit(CXCursor cursor, UnitKind kind,
                    const std::string &qualname) {
  ParsedUnit unit;
  unit.kind = kind;
  unit.name = CursorName(cursor);
  unit.qualname = qualname;
  std::tie(unit.lineno, unit.end_lineno) = LineSpan(cursor);
  unit.docstring =
      CleanDocComment(ToString(clang_Cursor_getRawCommentText(cursor)));
  return unit;
}

ParsedUnit MakeFunctionUnit(CXCursor cursor, UnitKind kind,
                            const std::string &qualname) {
  auto unit = MakeUnit(cursor, kind, qualname);
  unit.parameters = CountParameters(cursor);
  unit.syntax = SyntaxCollector().Collect(cursor);
  unit.tokens = UnitTokens(cursor);
  return unit;
}

ParsedUnit MakeClassUnit(CXCursor cursor) {
  const auto name = CursorName(cursor);
  auto unit = MakeUnit(cursor, UnitKind::kClass, name);
  VisitChildren(cursor, [&unit, &name](CXCursor child) {
    if (IsFunctionCursor(clang_getCursorKind(child)) &&
        clang_isCursorDefinition(child)) {
      unit.methods.push_back(MakeFunctionUnit(
          child, UnitKind::kMethod, name + "." + CursorName(child)));
    }
  });
  return unit;
}

class UnitCollector {
public:
  std::vector<ParsedUnit> Collect(CXCursor translation_unit) {
    units_.clear();
    VisitScope(translation_unit);
    return std::move(units_);
  }

private:
  void VisitScope(CXCursor scope) {
    VisitChildren(scope, [this](CXCursor child) { Visit(child); });
  }

  void Visit(CXCursor cursor) {
    if (!IsFromMainFile(cursor)) {
      return;
    }
    const auto kind = clang_getCursorKind(cursor);
    if (IsTransparentScope(kind)) {
      VisitScope(cursor);
      return;
    }
    if (!clang_isCursorDefinition(cursor)) {
      return;
    }
    if (IsClassCursor(kind)) {
      units_.push_back(MakeClassUnit(cursor));
      return;
    }
    if (IsFunctionCursor(kind)) {
      const auto owner = EnclosingClassName(cursor);
      const auto name = CursorName(cursor);
      units_.push_back(MakeFunctionUnit(
          cursor, UnitKind::kFunction, owner.empty() ? name : owner + "." + name));
    }
  }

  std::vector<ParsedUnit> units_;
};

bool ContainsArg(const std::vector<std::string> &args,
                 const std::string &needle) {
  return std::find(args.begin(), args.end(), needle) != args.end();
}

bool ContainsStandardFlag(const std::vector<std::string> &args) {
  return std::any_of(args.begin(), args.end(), [](const std::string &arg) {
    return arg.rfind("-std=", 0) == 0;
  });
}

} // namespace

std::string CleanDocComment(const std::string &raw) {
  std::vector<std::string> lines;
  std::istringstream stream(raw);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(StripCommentMarkers(line));
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  auto first = std::find_if(lines.begin(), lines.end(),
                            [](const std::string &l) { return !l.empty(); });
  std::string text;
  for (auto it = first; it != lines.end(); ++it) {
    if (it != first) {
      text += '\n';
    }
    text += *it;
  }
  return text;
}

std::vector<std::string>
BuildParserArguments(const std::filesystem::path &file,
                     const std::vector<std::string> &configured) {
  auto args = configured;
  if (file.extension() == ".c") {
    return args;
  }
  if (!ContainsArg(args, "-x")) {
    args.insert(args.begin(), {"-x", "c++"});
  }
  if (!ContainsStandardFlag(args)) {
    args.push_back("-std=c++17");
  }
  return args;
}

ClangSourceParser::ClangSourceParser(std::vector<std::string> arguments,
                                     std::shared_ptr<Logger> logger)
    : arguments_(std::move(arguments)),
      logger_(EnsureLogger(std::move(logger))) {}

ParsedFile ClangSourceParser::Parse(const std::string &path) {
  ParsedFile parsed;
  parsed.path = path;
  parsed.source = ReadSource(path);

  const auto args = BuildParserArguments(path, arguments_);
  std::vector<const char *> arg_pointers;
  arg_pointers.reserve(args.size());
  for (const auto &arg : args) {
    arg_pointers.push_back(arg.c_str());
  }

  IndexHandle index(clang_createIndex(0, 0), &clang_disposeIndex);
  CXTranslationUnit raw_unit = nullptr;
  const auto error = clang_parseTranslationUnit2(
      index.get(), path.c_str(), arg_pointers.data(),
      static_cast<int>(arg_pointers.size()), nullptr, 0,
      CXTranslationUnit_KeepGoing, &raw_unit);
  if (error != CXError_Success || raw_unit == nullptr) {
    throw ParseError(path,
                     "libclang error code " + std::to_string(error));
  }
  TranslationUnitHandle translation_unit(raw_unit,
                                         &clang_disposeTranslationUnit);

  std::optional<std::string> syntax_error;
  const unsigned count = clang_getNumDiagnostics(translation_unit.get());
  for (unsigned index_in_unit = 0; index_in_unit < count; ++index_in_unit) {
    CXDiagnostic diagnostic =
        clang_getDiagnostic(translation_unit.get(), index_in_unit);
    const auto severity = clang_getDiagnosticSeverity(diagnostic);
    const auto category = ToString(clang_getDiagnosticCategoryText(diagnostic));
    const bool in_main_file = clang_Location_isFromMainFile(
                                  clang_getDiagnosticLocation(diagnostic)) != 0;
    const auto message = ToString(clang_formatDiagnostic(
        diagnostic, clang_defaultDiagnosticDisplayOptions()));
    clang_disposeDiagnostic(diagnostic);

    logger_->Log(LogLevel::kDebug, "parser.diagnostic",
                 {{"path", path}, {"category", category}, {"message", message}});
    if (!syntax_error && in_main_file && severity >= CXDiagnostic_Error &&
        category == kParseIssueCategory) {
      syntax_error = message;
    }
  }
  if (syntax_error) {
    throw ParseError(path, *syntax_error);
  }

  parsed.units = UnitCollector().Collect(
      clang_getTranslationUnitCursor(translation_unit.get()));
  logger_->Log(LogLevel::kDebug, "Parsed source file",
               {{"path", path},
                {"units", std::to_string(parsed.units.size())}});
  return parsed;
}

} // namespace codecheck
