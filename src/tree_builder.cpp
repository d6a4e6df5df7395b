#include <codecheck/tree_builder.h>

#include <filesystem>
#include <unordered_map>
#include <utility>

namespace codecheck {

namespace {

struct ChildRef {
  bool is_directory = false;
  std::size_t index = 0;
};

struct DirectoryEntry {
  std::string name;
  std::string path;
  std::vector<ChildRef> children;
};

// Directories discovered during one BuildTree call, keyed by generic path.
class DirectoryArena {
public:
  explicit DirectoryArena(std::string root_path) {
    entries_.push_back({kRootNodeName, std::move(root_path), {}});
    lookup_.emplace(std::string{}, 0);
  }

  std::size_t Resolve(const std::filesystem::path &directory) {
    std::size_t parent = 0;
    std::filesystem::path current;
    for (const auto &part : directory) {
      current /= part;
      const auto key = current.generic_string();
      const auto found = lookup_.find(key);
      if (found != lookup_.end()) {
        parent = found->second;
        continue;
      }
      const auto index = entries_.size();
      entries_.push_back({part.string(), current.string(), {}});
      entries_[parent].children.push_back({true, index});
      lookup_.emplace(key, index);
      parent = index;
    }
    return parent;
  }

  void AddFile(std::size_t directory, std::size_t file_index) {
    entries_[directory].children.push_back({false, file_index});
  }

  ReportNode Materialize(std::size_t index, std::vector<ReportNode> &files) {
    auto &entry = entries_[index];
    auto node = MakeDirectoryNode(entry.name, entry.path);
    node.children.reserve(entry.children.size());
    for (const auto &child : entry.children) {
      if (child.is_directory) {
        node.children.push_back(Materialize(child.index, files));
      } else {
        node.children.push_back(std::move(files[child.index]));
      }
    }
    return node;
  }

private:
  std::vector<DirectoryEntry> entries_;
  std::unordered_map<std::string, std::size_t> lookup_;
};

// A directory whose only child is a directory holds no files of its own.
bool CanDescend(const ReportNode &node) {
  return node.IsDirectory() && node.children.size() == 1 &&
         node.children.front().IsDirectory();
}

} // namespace

ReportNode BuildTree(std::vector<ReportNode> files, std::string root_path) {
  DirectoryArena arena(std::move(root_path));
  for (std::size_t index = 0; index < files.size(); ++index) {
    const auto resolved = std::filesystem::weakly_canonical(files[index].path);
    arena.AddFile(arena.Resolve(resolved.parent_path()), index);
  }
  return arena.Materialize(0, files);
}

ReportNode BuildTree(std::vector<ReportNode> files) {
  return BuildTree(std::move(files), std::filesystem::current_path().string());
}

ReportNode PruneTree(ReportNode root) {
  while (CanDescend(root)) {
    ReportNode child = std::move(root.children.front());
    root = std::move(child);
  }
  return root;
}

} // namespace codecheck
