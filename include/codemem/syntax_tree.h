#pragma once

extern "C" {
#include <tree_sitter/api.h>
}

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codemem {

// Read-only view of one node. Only valid while the owning SyntaxTree lives.
class SyntaxNode {
public:
  SyntaxNode(TSNode node, std::string_view source);

  std::string_view Type() const;
  std::string Text() const;
  std::optional<SyntaxNode> Field(const char *name) const;
  std::vector<SyntaxNode> Children() const;
  std::vector<SyntaxNode> NamedChildren() const;
  void ForEachNamedChild(const std::function<void(const SyntaxNode &)> &visit)
      const;
  std::optional<SyntaxNode> FirstNamedChild() const;

  int StartLine() const;
  int EndLine() const;
  bool IsNamed() const;
  bool IsError() const;
  bool IsMissing() const;
  bool HasError() const;

private:
  TSNode node_;
  std::string_view source_;
};

class SyntaxTree {
public:
  // Parses Python source. Throws ParseFailure when no usable module tree
  // comes back.
  SyntaxTree(std::string source, std::string file_path);
  ~SyntaxTree();

  SyntaxTree(const SyntaxTree &) = delete;
  SyntaxTree &operator=(const SyntaxTree &) = delete;

  SyntaxNode Root() const;
  const std::string &file_path() const { return file_path_; }

private:
  std::string source_;
  std::string file_path_;
  TSTree *tree_ = nullptr;
};

} // namespace codemem
