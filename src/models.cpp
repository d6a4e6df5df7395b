#include <codecheck/models.h>

#include <codecheck/errors.h>

#include <algorithm>
#include <utility>

namespace codecheck {

namespace {

LeafPayload *MutableLeaf(NodePayload &payload) {
  if (auto *function = std::get_if<FunctionPayload>(&payload)) {
    return function;
  }
  if (auto *method = std::get_if<MethodPayload>(&payload)) {
    return method;
  }
  return nullptr;
}

const LeafPayload *ConstLeaf(const NodePayload &payload) {
  if (const auto *function = std::get_if<FunctionPayload>(&payload)) {
    return function;
  }
  if (const auto *method = std::get_if<MethodPayload>(&payload)) {
    return method;
  }
  return nullptr;
}

} // namespace

std::string NodeTypeName(NodeType type) {
  switch (type) {
  case NodeType::kDirectory:
    return "directory";
  case NodeType::kFile:
    return "file";
  case NodeType::kClass:
    return "class";
  case NodeType::kFunction:
    return "function";
  case NodeType::kMethod:
    return "method";
  }
  return "unknown";
}

Metrics Metrics::WithDuplication(Duplication record) const {
  Metrics copy = *this;
  copy.duplication = std::move(record);
  return copy;
}

NodeType ReportNode::Type() const {
  if (std::holds_alternative<DirectoryPayload>(payload)) {
    return NodeType::kDirectory;
  }
  if (std::holds_alternative<FilePayload>(payload)) {
    return NodeType::kFile;
  }
  if (std::holds_alternative<ClassPayload>(payload)) {
    return NodeType::kClass;
  }
  if (std::holds_alternative<FunctionPayload>(payload)) {
    return NodeType::kFunction;
  }
  return NodeType::kMethod;
}

bool ReportNode::IsLeaf() const { return ConstLeaf(payload) != nullptr; }

bool ReportNode::HasFileChildren() const {
  return std::any_of(children.begin(), children.end(), [](const auto &child) {
    return child.Type() == NodeType::kFile;
  });
}

const LeafPayload &ReportNode::Leaf() const {
  const auto *leaf = ConstLeaf(payload);
  if (leaf == nullptr) {
    throw InvariantViolation(NodeTypeName(Type()) + " node '" + name +
                             "' has no metrics");
  }
  return *leaf;
}

const SourceSpan *ReportNode::Span() const {
  if (const auto *leaf = ConstLeaf(payload)) {
    return &leaf->span;
  }
  if (const auto *type = std::get_if<ClassPayload>(&payload)) {
    return &type->span;
  }
  return nullptr;
}

const std::string &ReportNode::Docstring() const {
  static const std::string kEmpty;
  if (const auto *leaf = ConstLeaf(payload)) {
    return leaf->docstring;
  }
  if (const auto *type = std::get_if<ClassPayload>(&payload)) {
    return type->docstring;
  }
  return kEmpty;
}

void ReportNode::AttachDuplication(Duplication record) {
  auto *leaf = MutableLeaf(payload);
  if (leaf == nullptr) {
    throw InvariantViolation("cannot attach duplication to " +
                             NodeTypeName(Type()) + " node '" + name +
                             "' without metrics");
  }
  leaf->metrics = leaf->metrics.WithDuplication(std::move(record));
}

ReportNode MakeDirectoryNode(std::string name, std::string path) {
  ReportNode node;
  node.name = std::move(name);
  node.path = std::move(path);
  node.payload = DirectoryPayload{};
  return node;
}

ReportNode MakeFileNode(std::string name, std::string path) {
  ReportNode node;
  node.name = std::move(name);
  node.path = std::move(path);
  node.payload = FilePayload{};
  return node;
}

} // namespace codecheck
