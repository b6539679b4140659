#include <jsgraph/js_parser.h>

#include <jsgraph/errors.h>

#include <cctype>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include <tree_sitter/api.h>

extern "C" {
const TSLanguage *tree_sitter_javascript(void);
const TSLanguage *tree_sitter_typescript(void);
const TSLanguage *tree_sitter_tsx(void);
}

namespace jsgraph {
namespace {

constexpr int kMaxNestingDepth = 512;

using ParserHandle = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;
using TreeHandle = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;

const TSLanguage *LanguageFor(SourceDialect dialect) {
  switch (dialect) {
  case SourceDialect::kTypeScript:
    return tree_sitter_typescript();
  case SourceDialect::kTsx:
    return tree_sitter_tsx();
  case SourceDialect::kJavaScript:
    break;
  }
  return tree_sitter_javascript();
}

class NestingGuard {
public:
  explicit NestingGuard(int &depth) : depth_(depth) { ++depth_; }
  ~NestingGuard() { --depth_; }
  NestingGuard(const NestingGuard &) = delete;
  NestingGuard &operator=(const NestingGuard &) = delete;

  bool TooDeep() const { return depth_ > kMaxNestingDepth; }

private:
  int &depth_;
};

template <typename Data>
ast::ExpressionPtr MakeExpression(SourceLocation location, Data data) {
  auto expression = std::make_unique<ast::Expression>();
  expression->location = location;
  expression->data = std::move(data);
  return expression;
}

template <typename Data>
ast::StatementPtr MakeStatement(SourceLocation location, Data data) {
  auto statement = std::make_unique<ast::Statement>();
  statement->location = location;
  statement->data = std::move(data);
  return statement;
}

template <typename Data>
ast::PatternPtr MakePattern(SourceLocation location, Data data) {
  auto pattern = std::make_unique<ast::Pattern>();
  pattern->location = location;
  pattern->data = std::move(data);
  return pattern;
}

bool IsNull(TSNode node) { return ts_node_is_null(node); }

bool Is(TSNode node, const char *type) {
  return !IsNull(node) && std::strcmp(ts_node_type(node), type) == 0;
}

bool IsComment(TSNode node) {
  return Is(node, "comment") || Is(node, "html_comment");
}

SourceLocation LocationOf(TSNode node) {
  const auto point = ts_node_start_point(node);
  return {static_cast<int>(point.row) + 1, static_cast<int>(point.column) + 1};
}

TSNode Field(TSNode node, const char *name) {
  return ts_node_child_by_field_name(node, name,
                                     static_cast<uint32_t>(std::strlen(name)));
}

std::vector<TSNode> NamedChildren(TSNode node) {
  std::vector<TSNode> children;
  const auto count = ts_node_named_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_named_child(node, i);
    if (!IsComment(child)) {
      children.push_back(child);
    }
  }
  return children;
}

TSNode FirstNamedChild(TSNode node) {
  const auto children = NamedChildren(node);
  return children.empty() ? TSNode{} : children.front();
}

TSNode FirstChildOfType(TSNode node, const char *type) {
  for (const auto child : NamedChildren(node)) {
    if (Is(child, type)) {
      return child;
    }
  }
  return TSNode{};
}

// Anonymous tokens such as `async`, `static` or `*`.
bool HasToken(TSNode node, const char *token) {
  const auto count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(node, i);
    if (!ts_node_is_named(child) && Is(child, token)) {
      return true;
    }
  }
  return false;
}

bool HasOptionalChain(TSNode node) {
  return !IsNull(Field(node, "optional_chain")) || HasToken(node, "?.") ||
         !IsNull(FirstChildOfType(node, "optional_chain"));
}

// Children in source order with `std::nullopt` for elisions (`[a, , b]`).
std::vector<std::optional<TSNode>> ElementsWithHoles(TSNode node) {
  std::vector<std::optional<TSNode>> elements;
  bool seen_element = false;
  const auto count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(node, i);
    if (IsComment(child)) {
      continue;
    }
    if (ts_node_is_named(child)) {
      elements.emplace_back(child);
      seen_element = true;
    } else if (Is(child, ",")) {
      if (!seen_element) {
        elements.emplace_back(std::nullopt);
      }
      seen_element = false;
    }
  }
  return elements;
}

// Position of the member itself, after any decorators.
SourceLocation MemberLocation(TSNode node) {
  const auto count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(node, i);
    if (!Is(child, "decorator") && !IsComment(child)) {
      return LocationOf(child);
    }
  }
  return LocationOf(node);
}

std::string Unquote(const std::string &text) {
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'')) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

std::optional<TSNode> FirstSyntaxError(TSNode node) {
  if (Is(node, "ERROR") || ts_node_is_missing(node)) {
    return node;
  }
  const auto count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    const auto child = ts_node_child(node, i);
    if (ts_node_has_error(child) || ts_node_is_missing(child)) {
      if (const auto found = FirstSyntaxError(child)) {
        return found;
      }
    }
  }
  return std::nullopt;
}

// Walks a tree-sitter syntax tree and builds the ast:: model for it.
class Lowering {
public:
  Lowering(std::string_view source, std::string file)
      : source_(source), file_(std::move(file)) {}

  ast::Program Run(TSNode root) {
    CheckSyntax(root);
    ast::Program program;
    program.file = file_;
    for (const auto child : NamedChildren(root)) {
      if (Is(child, "hash_bang_line")) {
        continue;
      }
      program.body.push_back(LowerStatement(child));
    }
    return program;
  }

private:
  std::string Text(TSNode node) const {
    const auto start = ts_node_start_byte(node);
    const auto end = ts_node_end_byte(node);
    return std::string(source_.substr(start, end - start));
  }

  // Identifiers and string literals used as module export names.
  std::string NameText(TSNode node) const {
    return Is(node, "string") ? Unquote(Text(node)) : Text(node);
  }

  void CheckSyntax(TSNode root) const {
    if (!ts_node_has_error(root)) {
      return;
    }
    const auto error = FirstSyntaxError(root).value_or(root);
    const auto location = LocationOf(error);
    std::string message;
    if (ts_node_is_missing(error)) {
      message = std::string("Missing '") + ts_node_type(error) + "'";
    } else {
      auto text = Text(error);
      const auto line_end = text.find('\n');
      if (line_end != std::string::npos) {
        text.resize(line_end);
      }
      if (text.size() > 32) {
        text = text.substr(0, 32) + "...";
      }
      message = text.empty() ? "Unexpected end of input"
                             : "Unexpected token '" + text + "'";
    }
    throw ParseError(file_, location.line, location.column, message);
  }

  void CheckDepth(const NestingGuard &guard, TSNode node) const {
    if (guard.TooDeep()) {
      const auto location = LocationOf(node);
      throw ParseError(file_, location.line, location.column,
                       "Syntax is nested too deeply");
    }
  }

  // Statements.

  ast::StatementList LowerStatements(TSNode block) {
    ast::StatementList statements;
    if (IsNull(block)) {
      return statements;
    }
    for (const auto child : NamedChildren(block)) {
      statements.push_back(LowerStatement(child));
    }
    return statements;
  }

  ast::StatementPtr LowerStatement(TSNode node) {
    if (IsNull(node)) {
      return MakeStatement(SourceLocation{}, ast::EmptyStatement{});
    }
    NestingGuard guard(depth_);
    CheckDepth(guard, node);
    const auto location = LocationOf(node);

    if (Is(node, "expression_statement")) {
      const auto expression = FirstNamedChild(node);
      if (IsNull(expression) || Is(expression, "internal_module") ||
          Is(expression, "module")) {
        return MakeStatement(location, ast::EmptyStatement{});
      }
      return MakeStatement(location,
                           ast::ExpressionStatement{LowerExpression(expression)});
    }
    if (Is(node, "variable_declaration") || Is(node, "lexical_declaration")) {
      return MakeStatement(location, LowerVariableDeclaration(node));
    }
    if (Is(node, "function_declaration") ||
        Is(node, "generator_function_declaration")) {
      return MakeStatement(
          location, ast::FunctionDeclaration{LowerFunction(node, "", false,
                                                           location)});
    }
    if (Is(node, "class_declaration") ||
        Is(node, "abstract_class_declaration")) {
      return MakeStatement(location, ast::ClassDeclaration{LowerClass(node)});
    }
    if (Is(node, "statement_block")) {
      return MakeStatement(location,
                           ast::BlockStatement{LowerStatements(node)});
    }
    if (Is(node, "if_statement")) {
      ast::IfStatement statement;
      statement.test = LowerExpression(Field(node, "condition"));
      statement.consequent = LowerStatement(Field(node, "consequence"));
      const auto alternative = Field(node, "alternative");
      if (!IsNull(alternative)) {
        const auto branch = Is(alternative, "else_clause")
                                ? FirstNamedChild(alternative)
                                : alternative;
        if (!IsNull(branch)) {
          statement.alternate = LowerStatement(branch);
        }
      }
      return MakeStatement(location, std::move(statement));
    }
    if (Is(node, "for_statement")) {
      return MakeStatement(location, LowerForStatement(node));
    }
    if (Is(node, "for_in_statement")) {
      return MakeStatement(location, LowerForInOfStatement(node));
    }
    if (Is(node, "while_statement")) {
      ast::WhileStatement loop;
      loop.test = LowerExpression(Field(node, "condition"));
      loop.body = LowerStatement(Field(node, "body"));
      return MakeStatement(location, std::move(loop));
    }
    if (Is(node, "do_statement")) {
      ast::DoWhileStatement loop;
      loop.body = LowerStatement(Field(node, "body"));
      loop.test = LowerExpression(Field(node, "condition"));
      return MakeStatement(location, std::move(loop));
    }
    if (Is(node, "return_statement")) {
      return MakeStatement(location,
                           ast::ReturnStatement{LowerOptional(FirstNamedChild(node))});
    }
    if (Is(node, "throw_statement")) {
      return MakeStatement(location,
                           ast::ThrowStatement{LowerOptional(FirstNamedChild(node))});
    }
    if (Is(node, "break_statement") || Is(node, "continue_statement")) {
      ast::JumpStatement jump;
      jump.is_break = Is(node, "break_statement");
      const auto label = Field(node, "label");
      if (!IsNull(label)) {
        jump.label = Text(label);
      }
      return MakeStatement(location, std::move(jump));
    }
    if (Is(node, "try_statement")) {
      return MakeStatement(location, LowerTryStatement(node));
    }
    if (Is(node, "switch_statement")) {
      return MakeStatement(location, LowerSwitchStatement(node));
    }
    if (Is(node, "labeled_statement")) {
      ast::LabeledStatement statement;
      statement.label = Text(Field(node, "label"));
      statement.body = LowerStatement(Field(node, "body"));
      return MakeStatement(location, std::move(statement));
    }
    if (Is(node, "with_statement")) {
      ast::BlockStatement block;
      block.body.push_back(MakeStatement(
          location,
          ast::ExpressionStatement{LowerExpression(Field(node, "object"))}));
      block.body.push_back(LowerStatement(Field(node, "body")));
      return MakeStatement(location, std::move(block));
    }
    if (Is(node, "import_statement")) {
      return LowerImport(node);
    }
    if (Is(node, "export_statement")) {
      return LowerExport(node);
    }
    // Debugger statements, overload signatures and type-level declarations
    // (interface, type, enum, declare, namespace).
    return MakeStatement(location, ast::EmptyStatement{});
  }

  ast::VariableDeclaration LowerVariableDeclaration(TSNode node) {
    ast::VariableDeclaration declaration;
    const auto keyword = ts_node_child(node, 0);
    declaration.kind = IsNull(keyword) ? "var" : ts_node_type(keyword);
    for (const auto child : NamedChildren(node)) {
      if (!Is(child, "variable_declarator")) {
        continue;
      }
      ast::VariableDeclarator declarator;
      declarator.location = LocationOf(child);
      declarator.target = LowerPattern(Field(child, "name"));
      declarator.init = LowerOptional(Field(child, "value"));
      declaration.declarators.push_back(std::move(declarator));
    }
    return declaration;
  }

  ast::ForStatement LowerForStatement(TSNode node) {
    ast::ForStatement loop;
    const auto initializer = Field(node, "initializer");
    if (!IsNull(initializer) && !Is(initializer, "empty_statement")) {
      if (Is(initializer, "lexical_declaration") ||
          Is(initializer, "variable_declaration") ||
          Is(initializer, "expression_statement")) {
        loop.init = LowerStatement(initializer);
      } else {
        loop.init = MakeStatement(
            LocationOf(initializer),
            ast::ExpressionStatement{LowerExpression(initializer)});
      }
    }
    const auto condition = Field(node, "condition");
    if (!IsNull(condition) && !Is(condition, "empty_statement")) {
      loop.test = Is(condition, "expression_statement")
                      ? LowerOptional(FirstNamedChild(condition))
                      : LowerExpression(condition);
    }
    loop.update = LowerOptional(Field(node, "increment"));
    loop.body = LowerStatement(Field(node, "body"));
    return loop;
  }

  ast::ForInOfStatement LowerForInOfStatement(TSNode node) {
    ast::ForInOfStatement loop;
    loop.is_await = HasToken(node, "await");
    const auto operator_node = Field(node, "operator");
    loop.is_of = IsNull(operator_node) ? HasToken(node, "of")
                                       : Text(operator_node) == "of";
    const auto kind = Field(node, "kind");
    if (!IsNull(kind)) {
      loop.declaration_kind = Text(kind);
    } else {
      for (const char *keyword : {"var", "let", "const"}) {
        if (HasToken(node, keyword)) {
          loop.declaration_kind = keyword;
        }
      }
    }
    loop.target = LowerPattern(Field(node, "left"));
    loop.right = LowerExpression(Field(node, "right"));
    loop.body = LowerStatement(Field(node, "body"));
    return loop;
  }

  ast::TryStatement LowerTryStatement(TSNode node) {
    ast::TryStatement statement;
    statement.block = LowerStatements(Field(node, "body"));
    const auto handler = Field(node, "handler");
    if (!IsNull(handler)) {
      ast::CatchClause clause;
      clause.location = LocationOf(handler);
      const auto parameter = Field(handler, "parameter");
      if (!IsNull(parameter)) {
        clause.parameter = LowerPattern(parameter);
      }
      clause.body = LowerStatements(Field(handler, "body"));
      statement.handler = std::move(clause);
    }
    const auto finalizer = Field(node, "finalizer");
    if (!IsNull(finalizer)) {
      ast::FinallyClause clause;
      clause.location = LocationOf(finalizer);
      clause.body = LowerStatements(Field(finalizer, "body"));
      statement.finalizer = std::move(clause);
    }
    return statement;
  }

  ast::SwitchStatement LowerSwitchStatement(TSNode node) {
    ast::SwitchStatement statement;
    statement.discriminant = LowerExpression(Field(node, "value"));
    const auto body = Field(node, "body");
    if (IsNull(body)) {
      return statement;
    }
    for (const auto entry : NamedChildren(body)) {
      if (!Is(entry, "switch_case") && !Is(entry, "switch_default")) {
        continue;
      }
      ast::SwitchCase switch_case;
      const auto value = Field(entry, "value");
      if (!IsNull(value)) {
        switch_case.test = LowerExpression(value);
      }
      for (const auto child : NamedChildren(entry)) {
        if (!IsNull(value) && ts_node_eq(child, value)) {
          continue;
        }
        switch_case.body.push_back(LowerStatement(child));
      }
      statement.cases.push_back(std::move(switch_case));
    }
    return statement;
  }

  // Modules.

  ast::StatementPtr LowerImport(TSNode node) {
    const auto location = LocationOf(node);
    if (HasToken(node, "type") || HasToken(node, "typeof")) {
      return MakeStatement(location, ast::EmptyStatement{});
    }
    ast::ImportDeclaration declaration;
    auto source = Field(node, "source");
    for (const auto child : NamedChildren(node)) {
      if (Is(child, "import_clause")) {
        LowerImportClause(child, declaration.specifiers);
      } else if (Is(child, "import_require_clause")) {
        // `import name = require('module')`.
        const auto binding = FirstChildOfType(child, "identifier");
        if (!IsNull(binding)) {
          declaration.specifiers.push_back(
              ast::ImportSpecifier{"*", Text(binding), LocationOf(binding)});
        }
        source = Field(child, "source");
      }
    }
    if (IsNull(source)) {
      return MakeStatement(location, ast::EmptyStatement{});
    }
    declaration.source = Unquote(Text(source));
    return MakeStatement(location, std::move(declaration));
  }

  void LowerImportClause(TSNode clause,
                         std::vector<ast::ImportSpecifier> &specifiers) {
    for (const auto child : NamedChildren(clause)) {
      if (Is(child, "identifier")) {
        specifiers.push_back(
            ast::ImportSpecifier{"default", Text(child), LocationOf(child)});
      } else if (Is(child, "namespace_import")) {
        const auto binding = FirstNamedChild(child);
        if (!IsNull(binding)) {
          specifiers.push_back(
              ast::ImportSpecifier{"*", Text(binding), LocationOf(binding)});
        }
      } else if (Is(child, "named_imports")) {
        for (const auto specifier : NamedChildren(child)) {
          if (!Is(specifier, "import_specifier") ||
              HasToken(specifier, "type")) {
            continue;
          }
          const auto name = Field(specifier, "name");
          const auto alias = Field(specifier, "alias");
          const auto imported = NameText(name);
          specifiers.push_back(ast::ImportSpecifier{
              imported, IsNull(alias) ? imported : Text(alias),
              LocationOf(specifier)});
        }
      }
    }
  }

  ast::StatementPtr LowerExport(TSNode node) {
    const auto location = LocationOf(node);
    // `export type {...}`, `export = value` and `export as namespace N`.
    if (HasToken(node, "type") || HasToken(node, "=") ||
        HasToken(node, "namespace")) {
      return MakeStatement(location, ast::EmptyStatement{});
    }
    ast::ExportDeclaration declaration;
    const auto source = Field(node, "source");
    if (!IsNull(source)) {
      declaration.source = Unquote(Text(source));
    }
    const auto declared = Field(node, "declaration");

    if (HasToken(node, "default")) {
      declaration.kind = ast::ExportKind::kDefault;
      if (!IsNull(declared)) {
        auto statement = LowerStatement(declared);
        if (std::holds_alternative<ast::EmptyStatement>(statement->data)) {
          return statement;
        }
        declaration.declaration = std::move(statement);
        return MakeStatement(location, std::move(declaration));
      }
      const auto value = Field(node, "value");
      if (IsNull(value)) {
        return MakeStatement(location, ast::EmptyStatement{});
      }
      const auto value_location = LocationOf(value);
      if (Is(value, "class")) {
        declaration.declaration = MakeStatement(
            value_location, ast::ClassDeclaration{LowerClass(value)});
      } else if (Is(value, "function_expression") || Is(value, "function") ||
                 Is(value, "generator_function")) {
        declaration.declaration = MakeStatement(
            value_location,
            ast::FunctionDeclaration{
                LowerFunction(value, "", false, value_location)});
      } else {
        declaration.expression = LowerExpression(value);
      }
      return MakeStatement(location, std::move(declaration));
    }

    if (!IsNull(declared)) {
      auto statement = LowerStatement(declared);
      if (std::holds_alternative<ast::EmptyStatement>(statement->data)) {
        return statement;
      }
      declaration.kind = ast::ExportKind::kDeclaration;
      declaration.declaration = std::move(statement);
      return MakeStatement(location, std::move(declaration));
    }

    bool has_clause = false;
    for (const auto child : NamedChildren(node)) {
      if (Is(child, "export_clause")) {
        has_clause = true;
        for (const auto specifier : NamedChildren(child)) {
          if (!Is(specifier, "export_specifier") ||
              HasToken(specifier, "type")) {
            continue;
          }
          const auto name = Field(specifier, "name");
          const auto alias = Field(specifier, "alias");
          const auto local = NameText(name);
          declaration.specifiers.push_back(ast::ExportSpecifier{
              local, IsNull(alias) ? local : NameText(alias),
              LocationOf(specifier)});
        }
      } else if (Is(child, "namespace_export")) {
        declaration.kind = ast::ExportKind::kAll;
        const auto alias = FirstNamedChild(child);
        if (!IsNull(alias)) {
          declaration.alias = NameText(alias);
        }
        return MakeStatement(location, std::move(declaration));
      }
    }
    if (!has_clause && HasToken(node, "*")) {
      declaration.kind = ast::ExportKind::kAll;
      return MakeStatement(location, std::move(declaration));
    }
    declaration.kind = ast::ExportKind::kNamed;
    return MakeStatement(location, std::move(declaration));
  }

  // Functions and classes.

  ast::FunctionPtr LowerFunction(TSNode node, std::string name, bool is_method,
                                 SourceLocation location) {
    auto function = std::make_unique<ast::Function>();
    const auto name_node = Field(node, "name");
    function->name =
        name.empty() && !IsNull(name_node) ? Text(name_node) : std::move(name);
    function->location = location;
    function->is_async = HasToken(node, "async");
    function->is_generator = HasToken(node, "*") ||
                             Is(node, "generator_function") ||
                             Is(node, "generator_function_declaration");
    function->is_arrow = Is(node, "arrow_function");
    function->is_method = is_method;

    const auto parameters = Field(node, "parameters");
    if (!IsNull(parameters)) {
      function->parameters = LowerParameters(parameters);
    } else {
      const auto single = Field(node, "parameter");
      if (!IsNull(single)) {
        ast::Parameter parameter;
        parameter.location = LocationOf(single);
        parameter.target = LowerPattern(single);
        function->parameters.push_back(std::move(parameter));
      }
    }

    const auto body = Field(node, "body");
    if (IsNull(body)) {
      function->has_body = false;
    } else if (Is(body, "statement_block")) {
      function->body = LowerStatements(body);
    } else {
      function->expression_body = LowerExpression(body);
    }
    return function;
  }

  std::vector<ast::Parameter> LowerParameters(TSNode list) {
    std::vector<ast::Parameter> parameters;
    for (const auto child : NamedChildren(list)) {
      if (Is(child, "decorator")) {
        continue;
      }
      auto target = child;
      TSNode value{};
      if (Is(child, "required_parameter") || Is(child, "optional_parameter")) {
        target = Field(child, "pattern");
        value = Field(child, "value");
        if (IsNull(target) || Is(target, "this")) {
          continue;
        }
      }
      ast::Parameter parameter;
      parameter.location = LocationOf(target);
      parameter.target = LowerPattern(target);
      if (!IsNull(value)) {
        parameter.target = MakePattern(
            parameter.location,
            ast::DefaultPattern{std::move(parameter.target),
                                LowerExpression(value)});
      }
      parameters.push_back(std::move(parameter));
    }
    return parameters;
  }

  ast::ClassPtr LowerClass(TSNode node) {
    auto definition = std::make_unique<ast::Class>();
    const auto name = Field(node, "name");
    if (!IsNull(name)) {
      definition->name = Text(name);
    }
    definition->location = LocationOf(node);
    for (const auto child : NamedChildren(node)) {
      if (Is(child, "class_heritage")) {
        definition->super_class = LowerHeritage(child);
      }
    }
    const auto body = Field(node, "body");
    if (!IsNull(body)) {
      for (const auto member : NamedChildren(body)) {
        LowerClassMember(member, *definition);
      }
    }
    return definition;
  }

  ast::ExpressionPtr LowerHeritage(TSNode heritage) {
    for (const auto child : NamedChildren(heritage)) {
      if (Is(child, "implements_clause")) {
        continue;
      }
      if (Is(child, "extends_clause")) {
        const auto value = Field(child, "value");
        return LowerOptional(IsNull(value) ? FirstNamedChild(child) : value);
      }
      return LowerExpression(child);
    }
    return nullptr;
  }

  void LowerClassMember(TSNode node, ast::Class &definition) {
    ast::ClassMember member;
    member.location = MemberLocation(node);
    member.is_static = HasToken(node, "static");

    if (Is(node, "method_definition")) {
      member.kind = HasToken(node, "get")   ? ast::ClassMemberKind::kGetter
                    : HasToken(node, "set") ? ast::ClassMemberKind::kSetter
                                            : ast::ClassMemberKind::kMethod;
      LowerPropertyKey(Field(node, "name"), member.key, member.computed_key);
      if (member.key == "constructor" && !member.is_static &&
          member.kind == ast::ClassMemberKind::kMethod) {
        member.kind = ast::ClassMemberKind::kConstructor;
      }
      member.function = LowerFunction(node, member.key, true, member.location);
      if (!member.function->has_body) {
        return;
      }
    } else if (Is(node, "field_definition") ||
               Is(node, "public_field_definition")) {
      member.kind = ast::ClassMemberKind::kField;
      const auto key = Is(node, "field_definition") ? Field(node, "property")
                                                    : Field(node, "name");
      LowerPropertyKey(key, member.key, member.computed_key);
      member.value = LowerOptional(Field(node, "value"));
    } else if (Is(node, "class_static_block")) {
      member.kind = ast::ClassMemberKind::kStaticBlock;
      member.is_static = true;
      const auto body = Field(node, "body");
      member.static_block = LowerStatements(
          IsNull(body) ? FirstChildOfType(node, "statement_block") : body);
    } else {
      // Signatures, index signatures and decorators.
      return;
    }
    definition.members.push_back(std::move(member));
  }

  void LowerPropertyKey(TSNode key, std::string &text,
                        ast::ExpressionPtr &computed) {
    if (IsNull(key)) {
      return;
    }
    if (Is(key, "computed_property_name")) {
      computed = LowerOptional(FirstNamedChild(key));
      return;
    }
    text = NameText(key);
  }

  // Binding and assignment targets.

  ast::PatternPtr LowerPattern(TSNode node) {
    if (IsNull(node)) {
      return nullptr;
    }
    NestingGuard guard(depth_);
    CheckDepth(guard, node);
    const auto location = LocationOf(node);

    if (Is(node, "identifier") ||
        Is(node, "shorthand_property_identifier_pattern") ||
        Is(node, "undefined")) {
      return MakePattern(location, ast::BindingIdentifier{Text(node)});
    }
    if (Is(node, "parenthesized_expression")) {
      return LowerPattern(FirstNamedChild(node));
    }
    if (Is(node, "assignment_pattern")) {
      return MakePattern(location,
                         ast::DefaultPattern{LowerPattern(Field(node, "left")),
                                             LowerExpression(Field(node, "right"))});
    }
    if (Is(node, "rest_pattern")) {
      return MakePattern(location,
                         ast::RestPattern{LowerPattern(FirstNamedChild(node))});
    }
    if (Is(node, "array_pattern")) {
      ast::ArrayPattern pattern;
      for (const auto &element : ElementsWithHoles(node)) {
        pattern.elements.push_back(element ? LowerPattern(*element) : nullptr);
      }
      return MakePattern(location, std::move(pattern));
    }
    if (Is(node, "object_pattern")) {
      return MakePattern(location, LowerObjectPattern(node));
    }
    return MakePattern(location, ast::ExpressionTarget{LowerExpression(node)});
  }

  ast::ObjectPattern LowerObjectPattern(TSNode node) {
    ast::ObjectPattern pattern;
    for (const auto child : NamedChildren(node)) {
      if (Is(child, "rest_pattern")) {
        pattern.rest = LowerPattern(FirstNamedChild(child));
        continue;
      }
      ast::ObjectPatternProperty property;
      if (Is(child, "pair_pattern")) {
        LowerPropertyKey(Field(child, "key"), property.key,
                         property.computed_key);
        property.value = LowerPattern(Field(child, "value"));
      } else if (Is(child, "object_assignment_pattern")) {
        const auto left = Field(child, "left");
        const auto location = LocationOf(child);
        if (Is(left, "shorthand_property_identifier_pattern")) {
          property.key = Text(left);
        }
        property.value = MakePattern(
            location, ast::DefaultPattern{LowerPattern(left),
                                          LowerExpression(Field(child, "right"))});
      } else {
        property.key = Text(child);
        property.value = LowerPattern(child);
      }
      pattern.properties.push_back(std::move(property));
    }
    return pattern;
  }

  // Expressions.

  ast::ExpressionPtr LowerOptional(TSNode node) {
    return IsNull(node) ? nullptr : LowerExpression(node);
  }

  std::vector<ast::ExpressionPtr> LowerArguments(TSNode arguments) {
    std::vector<ast::ExpressionPtr> lowered;
    if (IsNull(arguments)) {
      return lowered;
    }
    for (const auto child : NamedChildren(arguments)) {
      lowered.push_back(LowerExpression(child));
    }
    return lowered;
  }

  void FlattenSequence(TSNode node, std::vector<ast::ExpressionPtr> &out) {
    for (const auto child : NamedChildren(node)) {
      if (Is(child, "sequence_expression")) {
        FlattenSequence(child, out);
      } else {
        out.push_back(LowerExpression(child));
      }
    }
  }

  ast::ExpressionPtr LowerExpression(TSNode node) {
    if (IsNull(node)) {
      return MakeExpression(SourceLocation{}, ast::Identifier{""});
    }
    NestingGuard guard(depth_);
    CheckDepth(guard, node);
    const auto location = LocationOf(node);

    if (Is(node, "identifier") || Is(node, "property_identifier") ||
        Is(node, "shorthand_property_identifier") ||
        Is(node, "private_property_identifier") || Is(node, "undefined")) {
      return MakeExpression(location, ast::Identifier{Text(node)});
    }
    if (Is(node, "this")) {
      return MakeExpression(location, ast::ThisExpression{});
    }
    if (Is(node, "super")) {
      return MakeExpression(location, ast::SuperExpression{});
    }
    if (Is(node, "number")) {
      return MakeExpression(location,
                            ast::Literal{ast::LiteralKind::kNumber, Text(node)});
    }
    if (Is(node, "string")) {
      return MakeExpression(location,
                            ast::Literal{ast::LiteralKind::kString, Text(node)});
    }
    if (Is(node, "regex")) {
      return MakeExpression(location,
                            ast::Literal{ast::LiteralKind::kRegex, Text(node)});
    }
    if (Is(node, "true") || Is(node, "false")) {
      return MakeExpression(
          location, ast::Literal{ast::LiteralKind::kBoolean, Text(node)});
    }
    if (Is(node, "null")) {
      return MakeExpression(location,
                            ast::Literal{ast::LiteralKind::kNull, "null"});
    }
    if (Is(node, "template_string")) {
      return MakeExpression(location, LowerTemplate(node, nullptr));
    }
    if (Is(node, "parenthesized_expression")) {
      return LowerExpression(FirstNamedChild(node));
    }
    if (Is(node, "array")) {
      ast::ArrayLiteral array;
      for (const auto &element : ElementsWithHoles(node)) {
        array.elements.push_back(element ? LowerExpression(*element) : nullptr);
      }
      return MakeExpression(location, std::move(array));
    }
    if (Is(node, "object")) {
      return MakeExpression(location, LowerObject(node));
    }
    if (Is(node, "function_expression") || Is(node, "function") ||
        Is(node, "generator_function") || Is(node, "arrow_function")) {
      return MakeExpression(
          location,
          ast::FunctionExpression{LowerFunction(node, "", false, location)});
    }
    if (Is(node, "class")) {
      return MakeExpression(location, ast::ClassExpression{LowerClass(node)});
    }
    if (Is(node, "unary_expression")) {
      return MakeExpression(
          location,
          ast::UnaryExpression{Text(Field(node, "operator")),
                               LowerExpression(Field(node, "argument"))});
    }
    if (Is(node, "update_expression")) {
      const auto operator_node = Field(node, "operator");
      const auto argument = Field(node, "argument");
      ast::UpdateExpression update;
      update.op = Text(operator_node);
      update.prefix =
          ts_node_start_byte(operator_node) < ts_node_start_byte(argument);
      update.operand = LowerExpression(argument);
      return MakeExpression(location, std::move(update));
    }
    if (Is(node, "binary_expression")) {
      return MakeExpression(
          location, ast::BinaryExpression{Text(Field(node, "operator")),
                                          LowerExpression(Field(node, "left")),
                                          LowerExpression(Field(node, "right"))});
    }
    if (Is(node, "ternary_expression")) {
      return MakeExpression(
          location,
          ast::ConditionalExpression{LowerExpression(Field(node, "condition")),
                                     LowerExpression(Field(node, "consequence")),
                                     LowerExpression(Field(node, "alternative"))});
    }
    if (Is(node, "assignment_expression")) {
      return MakeExpression(
          location,
          ast::AssignmentExpression{"=", LowerPattern(Field(node, "left")),
                                    LowerExpression(Field(node, "right"))});
    }
    if (Is(node, "augmented_assignment_expression")) {
      return MakeExpression(
          location,
          ast::AssignmentExpression{Text(Field(node, "operator")),
                                    LowerPattern(Field(node, "left")),
                                    LowerExpression(Field(node, "right"))});
    }
    if (Is(node, "sequence_expression")) {
      ast::SequenceExpression sequence;
      FlattenSequence(node, sequence.expressions);
      return MakeExpression(location, std::move(sequence));
    }
    if (Is(node, "member_expression")) {
      ast::MemberExpression member;
      member.object = LowerExpression(Field(node, "object"));
      member.property = Text(Field(node, "property"));
      member.optional = HasOptionalChain(node);
      return MakeExpression(location, std::move(member));
    }
    if (Is(node, "subscript_expression")) {
      ast::MemberExpression member;
      member.object = LowerExpression(Field(node, "object"));
      member.computed_property = LowerExpression(Field(node, "index"));
      member.optional = HasOptionalChain(node);
      return MakeExpression(location, std::move(member));
    }
    if (Is(node, "call_expression")) {
      return LowerCall(node, location);
    }
    if (Is(node, "new_expression")) {
      ast::NewExpression construction;
      construction.callee = LowerExpression(Field(node, "constructor"));
      construction.arguments = LowerArguments(Field(node, "arguments"));
      return MakeExpression(location, std::move(construction));
    }
    if (Is(node, "spread_element")) {
      return MakeExpression(
          location, ast::SpreadElement{LowerExpression(FirstNamedChild(node))});
    }
    if (Is(node, "await_expression")) {
      return MakeExpression(
          location, ast::AwaitExpression{LowerExpression(FirstNamedChild(node))});
    }
    if (Is(node, "yield_expression")) {
      ast::YieldExpression yield;
      yield.argument = LowerOptional(FirstNamedChild(node));
      yield.delegate = HasToken(node, "*");
      return MakeExpression(location, std::move(yield));
    }
    if (Is(node, "meta_property")) {
      const auto text = Text(node);
      const auto dot = text.find('.');
      ast::MetaProperty meta;
      meta.meta = text.substr(0, dot);
      if (dot != std::string::npos) {
        meta.property = text.substr(dot + 1);
      }
      return MakeExpression(location, std::move(meta));
    }
    // TypeScript expressions that only add type information.
    if (Is(node, "as_expression") || Is(node, "satisfies_expression") ||
        Is(node, "non_null_expression") ||
        Is(node, "instantiation_expression")) {
      return LowerExpression(FirstNamedChild(node));
    }
    if (Is(node, "type_assertion")) {
      const auto children = NamedChildren(node);
      return LowerOptional(children.empty() ? TSNode{} : children.back());
    }
    if (Is(node, "jsx_element") || Is(node, "jsx_self_closing_element") ||
        Is(node, "jsx_fragment")) {
      return MakeExpression(location, LowerJsx(node));
    }
    return MakeExpression(location, ast::Identifier{""});
  }

  ast::ExpressionPtr LowerCall(TSNode node, SourceLocation location) {
    const auto callee = Field(node, "function");
    const auto arguments = Field(node, "arguments");
    if (!IsNull(arguments) && Is(arguments, "template_string")) {
      return MakeExpression(location,
                            LowerTemplate(arguments, LowerExpression(callee)));
    }
    if (Is(callee, "import")) {
      ast::ImportCall import;
      const auto children = NamedChildren(arguments);
      if (!children.empty()) {
        import.source = LowerExpression(children.front());
      }
      return MakeExpression(location, std::move(import));
    }
    ast::CallExpression call;
    call.callee = LowerExpression(callee);
    call.arguments = LowerArguments(arguments);
    call.optional = HasOptionalChain(node);
    return MakeExpression(location, std::move(call));
  }

  ast::TemplateLiteral LowerTemplate(TSNode node, ast::ExpressionPtr tag) {
    ast::TemplateLiteral literal;
    literal.tag = std::move(tag);
    for (const auto child : NamedChildren(node)) {
      if (!Is(child, "template_substitution")) {
        continue;
      }
      const auto inner = FirstNamedChild(child);
      if (!IsNull(inner)) {
        literal.substitutions.push_back(LowerExpression(inner));
      }
    }
    return literal;
  }

  ast::ObjectLiteral LowerObject(TSNode node) {
    ast::ObjectLiteral object;
    for (const auto child : NamedChildren(node)) {
      ast::Property property;
      property.location = LocationOf(child);
      if (Is(child, "pair")) {
        property.kind = ast::PropertyKind::kInit;
        LowerPropertyKey(Field(child, "key"), property.key,
                         property.computed_key);
        property.value = LowerExpression(Field(child, "value"));
      } else if (Is(child, "shorthand_property_identifier")) {
        property.kind = ast::PropertyKind::kShorthand;
        property.key = Text(child);
        property.value =
            MakeExpression(property.location, ast::Identifier{property.key});
      } else if (Is(child, "method_definition")) {
        property.kind = HasToken(child, "get")   ? ast::PropertyKind::kGetter
                        : HasToken(child, "set") ? ast::PropertyKind::kSetter
                                                 : ast::PropertyKind::kMethod;
        LowerPropertyKey(Field(child, "name"), property.key,
                         property.computed_key);
        property.value = MakeExpression(
            property.location,
            ast::FunctionExpression{
                LowerFunction(child, property.key, true, property.location)});
      } else if (Is(child, "spread_element")) {
        property.kind = ast::PropertyKind::kSpread;
        property.value = LowerExpression(FirstNamedChild(child));
      } else {
        continue;
      }
      object.properties.push_back(std::move(property));
    }
    return object;
  }

  ast::JsxElement LowerJsx(TSNode node) {
    ast::JsxElement element;
    const bool self_closing = Is(node, "jsx_self_closing_element");
    const auto opening =
        self_closing ? node : FirstChildOfType(node, "jsx_opening_element");
    if (!IsNull(opening)) {
      const auto name = Field(opening, "name");
      if (!IsNull(name)) {
        element.name = Text(name);
      }
      for (const auto attribute : NamedChildren(opening)) {
        if (Is(attribute, "jsx_attribute")) {
          const auto children = NamedChildren(attribute);
          for (std::size_t i = 1; i < children.size(); ++i) {
            LowerJsxChild(children[i], element.expressions);
          }
        } else if (Is(attribute, "jsx_expression")) {
          LowerJsxChild(attribute, element.expressions);
        }
      }
    }
    if (!self_closing) {
      for (const auto child : NamedChildren(node)) {
        LowerJsxChild(child, element.expressions);
      }
    }
    return element;
  }

  void LowerJsxChild(TSNode node, std::vector<ast::ExpressionPtr> &out) {
    if (Is(node, "jsx_expression")) {
      const auto inner = FirstNamedChild(node);
      if (!IsNull(inner)) {
        out.push_back(LowerExpression(inner));
      }
    } else if (Is(node, "jsx_element") || Is(node, "jsx_self_closing_element") ||
               Is(node, "jsx_fragment")) {
      out.push_back(LowerExpression(node));
    }
  }

  std::string_view source_;
  std::string file_;
  int depth_ = 0;
};

} // namespace

SourceDialect DialectForFile(const std::string &file) {
  auto extension = std::filesystem::path(file).extension().string();
  for (auto &character : extension) {
    character = static_cast<char>(
        std::tolower(static_cast<unsigned char>(character)));
  }
  if (extension == ".ts" || extension == ".mts" || extension == ".cts") {
    return SourceDialect::kTypeScript;
  }
  if (extension == ".tsx") {
    return SourceDialect::kTsx;
  }
  return SourceDialect::kJavaScript;
}

ast::Program ParseModule(std::string_view source, const std::string &file) {
  return ParseModule(source, file, DialectForFile(file));
}

ast::Program ParseModule(std::string_view source, const std::string &file,
                         SourceDialect dialect) {
  if (source.size() > std::numeric_limits<uint32_t>::max()) {
    throw ParseError(file, 1, 1, "Source file is too large");
  }
  ParserHandle parser(ts_parser_new(), &ts_parser_delete);
  if (!parser || !ts_parser_set_language(parser.get(), LanguageFor(dialect))) {
    throw std::runtime_error("tree-sitter grammar is incompatible with the "
                             "linked tree-sitter runtime");
  }
  TreeHandle tree(ts_parser_parse_string(parser.get(), nullptr, source.data(),
                                         static_cast<uint32_t>(source.size())),
                  &ts_tree_delete);
  if (!tree) {
    throw ParseError(file, 1, 1, "tree-sitter produced no syntax tree");
  }
  return Lowering(source, file).Run(ts_tree_root_node(tree.get()));
}

} // namespace jsgraph
