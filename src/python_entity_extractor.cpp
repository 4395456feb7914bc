#include <codemem/python_entity_extractor.h>

#include <codemem/key_scheme.h>
#include <codemem/python_literals.h>
#include <codemem/syntax_tree.h>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codemem {

namespace {
using ClassContext = std::optional<std::string>;

std::string Join(const std::vector<std::string> &values,
                 const std::string &separator) {
  std::string joined;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += values[i];
  }
  return joined;
}

bool IsComment(const SyntaxNode &node) { return node.Type() == "comment"; }

std::optional<SyntaxNode> FirstStatement(const SyntaxNode &block) {
  for (const auto &child : block.NamedChildren()) {
    if (!IsComment(child)) {
      return child;
    }
  }
  return std::nullopt;
}

std::optional<StringLiteral> EvaluateStringNode(const SyntaxNode &node) {
  if (node.Type() == "string") {
    return EvaluateStringLiteral(node.Text());
  }
  if (node.Type() != "concatenated_string") {
    return std::nullopt;
  }

  StringLiteral combined;
  for (const auto &part : node.NamedChildren()) {
    if (IsComment(part)) {
      continue;
    }
    const auto literal = EvaluateStringNode(part);
    if (!literal) {
      return std::nullopt;
    }
    combined.value += literal->value;
    combined.is_bytes = combined.is_bytes || literal->is_bytes;
    combined.is_formatted = combined.is_formatted || literal->is_formatted;
  }
  return combined;
}

// Only a leading bare str literal counts; f-strings and bytes do not.
std::optional<std::string> DocstringOf(const std::optional<SyntaxNode> &body) {
  if (!body) {
    return std::nullopt;
  }
  const auto statement = FirstStatement(*body);
  if (!statement || statement->Type() != "expression_statement") {
    return std::nullopt;
  }

  std::vector<SyntaxNode> expressions;
  for (const auto &child : statement->NamedChildren()) {
    if (!IsComment(child)) {
      expressions.push_back(child);
    }
  }
  if (expressions.size() != 1) {
    return std::nullopt;
  }

  const auto literal = EvaluateStringNode(expressions.front());
  if (!literal || literal->is_bytes || literal->is_formatted) {
    return std::nullopt;
  }
  auto cleaned = CleanDocstring(literal->value);
  if (cleaned.empty()) {
    return std::nullopt;
  }
  return cleaned;
}

std::string RenderParameter(const SyntaxNode &parameter) {
  const auto type = parameter.Type();
  if (type == "identifier") {
    return parameter.Text();
  }
  if (type == "keyword_separator") {
    return "*";
  }
  if (type == "positional_separator") {
    return "/";
  }
  if (type == "list_splat_pattern" || type == "dictionary_splat_pattern") {
    const auto marker = type == "list_splat_pattern" ? "*" : "**";
    const auto target = parameter.FirstNamedChild();
    return marker + (target ? target->Text() : std::string{});
  }
  if (type == "typed_parameter") {
    const auto annotation = parameter.Field("type");
    const auto target = parameter.FirstNamedChild();
    std::string rendered = target ? RenderParameter(*target) : std::string{};
    if (annotation) {
      rendered += ": " + CollapseWhitespace(annotation->Text());
    }
    return rendered;
  }
  if (type == "default_parameter" || type == "typed_default_parameter") {
    const auto name = parameter.Field("name");
    const auto annotation = parameter.Field("type");
    const auto value = parameter.Field("value");
    std::string rendered = name ? RenderParameter(*name) : std::string{};
    if (annotation) {
      rendered += ": " + CollapseWhitespace(annotation->Text());
    }
    if (value) {
      rendered += annotation ? " = " : "=";
      rendered += CollapseWhitespace(value->Text());
    }
    return rendered;
  }
  return CollapseWhitespace(parameter.Text());
}

bool IsAsync(const SyntaxNode &function) {
  for (const auto &child : function.Children()) {
    if (child.Type() == "async") {
      return true;
    }
    if (child.Type() == "def") {
      return false;
    }
  }
  return false;
}

std::string BuildSignature(const SyntaxNode &function, const SyntaxNode &name,
                           const SyntaxNode &parameters) {
  std::vector<std::string> rendered;
  for (const auto &parameter : parameters.NamedChildren()) {
    if (IsComment(parameter) || parameter.IsError()) {
      continue;
    }
    rendered.push_back(RenderParameter(parameter));
  }

  std::string signature = IsAsync(function) ? "async def " : "def ";
  signature += name.Text() + "(" + Join(rendered, ", ") + ")";
  if (const auto return_type = function.Field("return_type")) {
    signature += " -> " + CollapseWhitespace(return_type->Text());
  }
  return signature;
}

std::string RenderStringValue(const StringLiteral &literal) {
  if (literal.is_formatted) {
    return kComplexValueMarker;
  }
  const auto repr = PythonStringRepr(literal.value);
  return literal.is_bytes ? "b" + repr : repr;
}

std::string RenderValue(const SyntaxNode &value) {
  const auto type = value.Type();
  if (type == "string" || type == "concatenated_string") {
    const auto literal = EvaluateStringNode(value);
    return literal ? RenderStringValue(*literal) : kComplexValueMarker;
  }
  if (type == "integer") {
    return NormalizeIntegerLiteral(value.Text());
  }
  if (type == "float") {
    auto text = value.Text();
    std::erase(text, '_');
    return text;
  }
  if (type == "true") {
    return "True";
  }
  if (type == "false") {
    return "False";
  }
  if (type == "none") {
    return "None";
  }
  if (type == "unary_operator") {
    const auto operand = value.Field("argument");
    const auto text = CollapseWhitespace(value.Text());
    const bool numeric = operand && (operand->Type() == "integer" ||
                                     operand->Type() == "float");
    if (numeric && !text.empty() &&
        (text.front() == '-' || text.front() == '+')) {
      const auto rendered = RenderValue(*operand);
      return text.front() == '-' ? "-" + rendered : rendered;
    }
    return kComplexValueMarker;
  }
  if (type == "parenthesized_expression") {
    const auto inner = value.FirstNamedChild();
    return inner ? RenderValue(*inner) : kComplexValueMarker;
  }
  if (type == "list" || type == "tuple" || type == "set") {
    return kCollectionValueMarker;
  }
  if (type == "dictionary") {
    return kMappingValueMarker;
  }
  return kComplexValueMarker;
}

std::string RenderBase(const SyntaxNode &base) {
  const auto type = base.Type();
  if (type == "identifier") {
    return base.Text();
  }
  if (type == "attribute") {
    const auto text = base.Text();
    std::string dotted;
    for (const auto character : text) {
      if (character != ' ' && character != '\t' && character != '\n' &&
          character != '\r' && character != '\\') {
        dotted.push_back(character);
      }
    }
    return dotted;
  }
  return kComplexBaseMarker;
}

class EntityCollector {
public:
  EntityCollector(std::string file_path, Logger &logger)
      : file_path_(std::move(file_path)), logger_(&logger) {}

  ExtractionResult Collect(const SyntaxNode &module) {
    VisitBlock(module, std::nullopt);
    return std::move(result_);
  }

private:
  void VisitBlock(const SyntaxNode &block, const ClassContext &context) {
    block.ForEachNamedChild([&](const SyntaxNode &statement) {
      VisitStatement(statement, context);
    });
  }

  void VisitStatement(const SyntaxNode &statement,
                      const ClassContext &context) {
    const auto type = statement.Type();
    if (statement.IsError()) {
      Skip(statement, "unparseable statement");
      return;
    }
    if (type == "class_definition") {
      VisitClass(statement);
      return;
    }
    if (type == "function_definition") {
      VisitFunction(statement, context);
      return;
    }
    if (type == "decorated_definition") {
      const auto definition = statement.Field("definition");
      if (!definition) {
        Skip(statement, "decorator without definition");
        return;
      }
      VisitStatement(*definition, context);
      return;
    }
    if (type == "expression_statement") {
      for (const auto &expression : statement.NamedChildren()) {
        if (expression.Type() == "assignment") {
          VisitAssignment(statement, expression, context);
        }
      }
    }
  }

  void VisitClass(const SyntaxNode &node) {
    const auto name = node.Field("name");
    if (!name || name->IsMissing() || name->HasError()) {
      Skip(node, "class without a name");
      return;
    }
    if (const auto superclasses = node.Field("superclasses");
        superclasses && superclasses->HasError()) {
      Skip(node, "malformed base class list");
      return;
    }

    EntityRecord record;
    record.entity_type = EntityType::kClass;
    record.file_path = file_path_;
    record.name = name->Text();
    record.line_start = node.StartLine();
    record.line_end = node.EndLine();
    record.bases = CollectBases(node);
    const auto body = node.Field("body");
    record.docstring = DocstringOf(body);
    Add(std::move(record));

    if (body) {
      VisitBlock(*body, name->Text());
    }
  }

  void VisitFunction(const SyntaxNode &node, const ClassContext &context) {
    const auto name = node.Field("name");
    const auto parameters = node.Field("parameters");
    if (!name || name->IsMissing()) {
      Skip(node, "function without a name");
      return;
    }
    if (!parameters || parameters->HasError() || name->HasError()) {
      Skip(node, "malformed parameter list");
      return;
    }

    EntityRecord record;
    record.entity_type =
        context ? EntityType::kMethod : EntityType::kFunction;
    record.file_path = file_path_;
    record.name = name->Text();
    record.parent_class = context;
    record.line_start = node.StartLine();
    record.line_end = node.EndLine();
    record.signature = BuildSignature(node, *name, *parameters);
    record.docstring = DocstringOf(node.Field("body"));
    Add(std::move(record));
  }

  void VisitAssignment(const SyntaxNode &statement,
                       const SyntaxNode &assignment,
                       const ClassContext &context) {
    std::vector<std::string> targets;
    std::optional<SyntaxNode> value;
    std::optional<SyntaxNode> current = assignment;
    while (current) {
      if (const auto left = current->Field("left");
          left && left->Type() == "identifier") {
        targets.push_back(left->Text());
      }
      const auto right = current->Field("right");
      if (right && right->Type() == "assignment") {
        current = right;
        continue;
      }
      value = right;
      current.reset();
    }

    // Bare annotations (`x: int`) bind nothing.
    if (!value || targets.empty()) {
      return;
    }

    const auto value_repr = RenderValue(*value);
    for (const auto &target : targets) {
      EntityRecord record;
      record.entity_type = EntityType::kVariable;
      record.file_path = file_path_;
      record.name = target;
      record.parent_class = context;
      record.line_start = statement.StartLine();
      record.line_end = statement.EndLine();
      record.value_repr = value_repr;
      Add(std::move(record));
    }
  }

  std::vector<std::string> CollectBases(const SyntaxNode &node) const {
    std::vector<std::string> bases;
    const auto superclasses = node.Field("superclasses");
    if (!superclasses) {
      return bases;
    }
    for (const auto &base : superclasses->NamedChildren()) {
      if (IsComment(base) || base.Type() == "keyword_argument") {
        continue;
      }
      bases.push_back(RenderBase(base));
    }
    return bases;
  }

  void Add(EntityRecord record) {
    auto id = EntityId(record);
    if (const auto existing = positions_.find(id);
        existing != positions_.end()) {
      logger_->Log(LogLevel::kDebug, "extract.entity_redefined",
                   {{"file", file_path_}, {"id", id}});
      result_.entities[existing->second] = std::move(record);
      return;
    }
    positions_.emplace(std::move(id), result_.entities.size());
    result_.entities.push_back(std::move(record));
  }

  void Skip(const SyntaxNode &node, const std::string &reason) {
    ++result_.skipped_nodes;
    logger_->Log(LogLevel::kWarn, "extract.node_skipped",
                 {{"file", file_path_},
                  {"line", std::to_string(node.StartLine())},
                  {"node", std::string(node.Type())},
                  {"reason", reason}});
  }

  std::string file_path_;
  Logger *logger_;
  ExtractionResult result_;
  std::unordered_map<std::string, std::size_t> positions_;
};
} // namespace

PythonEntityExtractor::PythonEntityExtractor(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

ExtractionResult PythonEntityExtractor::Extract(const std::string &content,
                                                const std::string &file_path) {
  const SyntaxTree tree(content, file_path);
  EntityCollector collector(file_path, *logger_);
  auto result = collector.Collect(tree.Root());
  logger_->Log(LogLevel::kDebug, "extract.file_complete",
               {{"file", file_path},
                {"entities", std::to_string(result.entities.size())},
                {"skipped_nodes", std::to_string(result.skipped_nodes)}});
  return result;
}

} // namespace codemem
