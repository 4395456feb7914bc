#include <codemem/syntax_tree.h>

#include <codemem/errors.h>

#include <cstdint>
#include <cstring>
#include <limits>
#include <utility>

extern "C" const TSLanguage *tree_sitter_python(void);

namespace codemem {

namespace {
using ParserHandle = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;

bool HasUsableStatement(TSNode root) {
  const auto count = ts_node_named_child_count(root);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_named_child(root, i);
    if (!ts_node_is_error(child) &&
        std::strcmp(ts_node_type(child), "comment") != 0) {
      return true;
    }
  }
  return false;
}
} // namespace

SyntaxNode::SyntaxNode(TSNode node, std::string_view source)
    : node_(node), source_(source) {}

std::string_view SyntaxNode::Type() const { return ts_node_type(node_); }

std::string SyntaxNode::Text() const {
  const auto start = ts_node_start_byte(node_);
  const auto end = ts_node_end_byte(node_);
  if (start >= source_.size() || end <= start) {
    return {};
  }
  return std::string(source_.substr(start, end - start));
}

std::optional<SyntaxNode> SyntaxNode::Field(const char *name) const {
  const auto child = ts_node_child_by_field_name(
      node_, name, static_cast<std::uint32_t>(std::strlen(name)));
  if (ts_node_is_null(child)) {
    return std::nullopt;
  }
  return SyntaxNode(child, source_);
}

std::vector<SyntaxNode> SyntaxNode::Children() const {
  std::vector<SyntaxNode> children;
  const auto count = ts_node_child_count(node_);
  children.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    children.emplace_back(ts_node_child(node_, i), source_);
  }
  return children;
}

std::vector<SyntaxNode> SyntaxNode::NamedChildren() const {
  std::vector<SyntaxNode> children;
  const auto count = ts_node_named_child_count(node_);
  children.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    children.emplace_back(ts_node_named_child(node_, i), source_);
  }
  return children;
}

void SyntaxNode::ForEachNamedChild(
    const std::function<void(const SyntaxNode &)> &visit) const {
  const auto count = ts_node_named_child_count(node_);
  for (std::uint32_t i = 0; i < count; ++i) {
    visit(SyntaxNode(ts_node_named_child(node_, i), source_));
  }
}

std::optional<SyntaxNode> SyntaxNode::FirstNamedChild() const {
  if (ts_node_named_child_count(node_) == 0) {
    return std::nullopt;
  }
  return SyntaxNode(ts_node_named_child(node_, 0), source_);
}

int SyntaxNode::StartLine() const {
  return static_cast<int>(ts_node_start_point(node_).row) + 1;
}

int SyntaxNode::EndLine() const {
  const auto start = ts_node_start_point(node_);
  const auto end = ts_node_end_point(node_);
  // A node that stops right after a newline ends on the previous line.
  if (end.column == 0 && end.row > start.row) {
    return static_cast<int>(end.row);
  }
  return static_cast<int>(end.row) + 1;
}

bool SyntaxNode::IsNamed() const { return ts_node_is_named(node_); }

bool SyntaxNode::IsError() const { return ts_node_is_error(node_); }

bool SyntaxNode::IsMissing() const { return ts_node_is_missing(node_); }

bool SyntaxNode::HasError() const { return ts_node_has_error(node_); }

SyntaxTree::SyntaxTree(std::string source, std::string file_path)
    : source_(std::move(source)), file_path_(std::move(file_path)) {
  if (source_.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw ParseFailure(file_path_, "file too large");
  }

  ParserHandle parser(ts_parser_new(), &ts_parser_delete);
  if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python())) {
    throw ParseFailure(file_path_, "python grammar could not be loaded");
  }

  tree_ = ts_parser_parse_string(parser.get(), nullptr, source_.data(),
                                 static_cast<std::uint32_t>(source_.size()));
  if (tree_ == nullptr) {
    throw ParseFailure(file_path_, "parser returned no tree");
  }

  const auto root = ts_tree_root_node(tree_);
  const bool unusable =
      ts_node_is_error(root) ||
      std::strcmp(ts_node_type(root), "module") != 0 ||
      (ts_node_has_error(root) && !HasUsableStatement(root));
  if (unusable) {
    ts_tree_delete(tree_);
    tree_ = nullptr;
    throw ParseFailure(file_path_, "no statement could be parsed");
  }
}

SyntaxTree::~SyntaxTree() {
  if (tree_ != nullptr) {
    ts_tree_delete(tree_);
  }
}

SyntaxNode SyntaxTree::Root() const {
  return SyntaxNode(ts_tree_root_node(tree_), source_);
}

} // namespace codemem
