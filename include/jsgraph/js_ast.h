#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jsgraph {

// 1-based position of the first character of a node.
struct SourceLocation {
  int line = 1;
  int column = 1;
};

} // namespace jsgraph

namespace jsgraph::ast {

struct Expression;
struct Statement;
struct Pattern;
struct Function;
struct Class;

using ExpressionPtr = std::unique_ptr<Expression>;
using StatementPtr = std::unique_ptr<Statement>;
using PatternPtr = std::unique_ptr<Pattern>;
using FunctionPtr = std::unique_ptr<Function>;
using ClassPtr = std::unique_ptr<Class>;
using StatementList = std::vector<StatementPtr>;

// Binding and assignment targets.

struct BindingIdentifier {
  std::string name;
};

struct ObjectPatternProperty {
  std::string key;
  ExpressionPtr computed_key;
  PatternPtr value;
};

struct ObjectPattern {
  std::vector<ObjectPatternProperty> properties;
  PatternPtr rest;
};

struct ArrayPattern {
  // Null entries are elisions.
  std::vector<PatternPtr> elements;
};

struct DefaultPattern {
  PatternPtr target;
  ExpressionPtr value;
};

struct RestPattern {
  PatternPtr target;
};

// Member expressions and other non-binding assignment targets.
struct ExpressionTarget {
  ExpressionPtr expression;
};

struct Pattern {
  SourceLocation location;
  std::variant<BindingIdentifier, ObjectPattern, ArrayPattern, DefaultPattern,
               RestPattern, ExpressionTarget>
      data;
};

// Expressions.

struct Identifier {
  std::string name;
};

enum class LiteralKind { kNumber, kString, kRegex, kBoolean, kNull };

struct Literal {
  LiteralKind kind = LiteralKind::kNull;
  std::string raw;
};

struct TemplateLiteral {
  ExpressionPtr tag;
  std::vector<ExpressionPtr> substitutions;
};

struct ThisExpression {};
struct SuperExpression {};

// `new.target` and `import.meta`.
struct MetaProperty {
  std::string meta;
  std::string property;
};

struct ArrayLiteral {
  // Null entries are holes.
  std::vector<ExpressionPtr> elements;
};

enum class PropertyKind { kInit, kShorthand, kMethod, kGetter, kSetter, kSpread };

struct Property {
  PropertyKind kind = PropertyKind::kInit;
  std::string key;
  ExpressionPtr computed_key;
  ExpressionPtr value;
  SourceLocation location;
};

struct ObjectLiteral {
  std::vector<Property> properties;
};

struct FunctionExpression {
  FunctionPtr function;
};

struct ClassExpression {
  ClassPtr definition;
};

struct UnaryExpression {
  std::string op;
  ExpressionPtr operand;
};

struct UpdateExpression {
  std::string op;
  bool prefix = false;
  ExpressionPtr operand;
};

// Arithmetic, relational and logical operators.
struct BinaryExpression {
  std::string op;
  ExpressionPtr left;
  ExpressionPtr right;
};

struct ConditionalExpression {
  ExpressionPtr test;
  ExpressionPtr consequent;
  ExpressionPtr alternate;
};

struct AssignmentExpression {
  std::string op;
  PatternPtr target;
  ExpressionPtr value;
};

struct SequenceExpression {
  std::vector<ExpressionPtr> expressions;
};

struct MemberExpression {
  ExpressionPtr object;
  std::string property;
  ExpressionPtr computed_property;
  bool optional = false;
};

struct CallExpression {
  ExpressionPtr callee;
  std::vector<ExpressionPtr> arguments;
  bool optional = false;
};

struct NewExpression {
  ExpressionPtr callee;
  std::vector<ExpressionPtr> arguments;
};

struct SpreadElement {
  ExpressionPtr argument;
};

struct AwaitExpression {
  ExpressionPtr argument;
};

struct YieldExpression {
  ExpressionPtr argument;
  bool delegate = false;
};

// `import(specifier)`.
struct ImportCall {
  ExpressionPtr source;
};

// JSX elements and fragments. Only the embedded expressions are kept, from
// attribute values and children in source order.
struct JsxElement {
  // Empty for fragments.
  std::string name;
  std::vector<ExpressionPtr> expressions;
};

struct Expression {
  SourceLocation location;
  std::variant<Identifier, Literal, TemplateLiteral, ThisExpression,
               SuperExpression, MetaProperty, ArrayLiteral, ObjectLiteral,
               FunctionExpression, ClassExpression, UnaryExpression,
               UpdateExpression, BinaryExpression, ConditionalExpression,
               AssignmentExpression, SequenceExpression, MemberExpression,
               CallExpression, NewExpression, SpreadElement, AwaitExpression,
               YieldExpression, ImportCall, JsxElement>
      data;
};

// Functions and classes.

struct Parameter {
  PatternPtr target;
  SourceLocation location;
};

struct Function {
  std::string name;
  SourceLocation location;
  bool is_async = false;
  bool is_generator = false;
  bool is_arrow = false;
  bool is_method = false;
  std::vector<Parameter> parameters;
  StatementList body;
  // Concise arrow body; when set `body` is empty.
  ExpressionPtr expression_body;
  // False for overload signatures and ambient declarations.
  bool has_body = true;
};

enum class ClassMemberKind {
  kConstructor,
  kMethod,
  kGetter,
  kSetter,
  kField,
  kStaticBlock
};

struct ClassMember {
  ClassMemberKind kind = ClassMemberKind::kMethod;
  std::string key;
  ExpressionPtr computed_key;
  bool is_static = false;
  SourceLocation location;
  FunctionPtr function;
  ExpressionPtr value;
  StatementList static_block;
};

struct Class {
  std::string name;
  SourceLocation location;
  ExpressionPtr super_class;
  std::vector<ClassMember> members;
};

// Statements.

struct VariableDeclarator {
  PatternPtr target;
  ExpressionPtr init;
  SourceLocation location;
};

struct VariableDeclaration {
  std::string kind;
  std::vector<VariableDeclarator> declarators;
};

struct FunctionDeclaration {
  FunctionPtr function;
};

struct ClassDeclaration {
  ClassPtr definition;
};

struct ExpressionStatement {
  ExpressionPtr expression;
};

struct BlockStatement {
  StatementList body;
};

struct IfStatement {
  ExpressionPtr test;
  StatementPtr consequent;
  StatementPtr alternate;
};

struct ForStatement {
  StatementPtr init;
  ExpressionPtr test;
  ExpressionPtr update;
  StatementPtr body;
};

// for-in, for-of and for-await-of.
struct ForInOfStatement {
  bool is_of = false;
  bool is_await = false;
  // Empty when the loop assigns to an existing target.
  std::string declaration_kind;
  PatternPtr target;
  ExpressionPtr right;
  StatementPtr body;
};

struct WhileStatement {
  ExpressionPtr test;
  StatementPtr body;
};

struct DoWhileStatement {
  StatementPtr body;
  ExpressionPtr test;
};

struct ReturnStatement {
  ExpressionPtr argument;
};

struct ThrowStatement {
  ExpressionPtr argument;
};

struct JumpStatement {
  bool is_break = true;
  std::string label;
};

struct CatchClause {
  // Null for `catch { ... }`.
  PatternPtr parameter;
  StatementList body;
  SourceLocation location;
};

struct FinallyClause {
  StatementList body;
  SourceLocation location;
};

struct TryStatement {
  StatementList block;
  std::optional<CatchClause> handler;
  std::optional<FinallyClause> finalizer;
};

struct SwitchCase {
  // Null for `default:`.
  ExpressionPtr test;
  StatementList body;
};

struct SwitchStatement {
  ExpressionPtr discriminant;
  std::vector<SwitchCase> cases;
};

struct LabeledStatement {
  std::string label;
  StatementPtr body;
};

struct EmptyStatement {};

struct ImportSpecifier {
  // "default" for default imports, "*" for namespace imports.
  std::string imported;
  std::string local;
  SourceLocation location;
};

struct ImportDeclaration {
  std::string source;
  std::vector<ImportSpecifier> specifiers;
};

struct ExportSpecifier {
  std::string local;
  std::string exported;
  SourceLocation location;
};

enum class ExportKind { kNamed, kDefault, kDeclaration, kAll };

struct ExportDeclaration {
  ExportKind kind = ExportKind::kNamed;
  std::vector<ExportSpecifier> specifiers;
  // Module specifier of `export ... from`.
  std::string source;
  // `export * as alias from`.
  std::string alias;
  StatementPtr declaration;
  ExpressionPtr expression;
};

struct Statement {
  SourceLocation location;
  std::variant<VariableDeclaration, FunctionDeclaration, ClassDeclaration,
               ExpressionStatement, BlockStatement, IfStatement, ForStatement,
               ForInOfStatement, WhileStatement, DoWhileStatement,
               ReturnStatement, ThrowStatement, JumpStatement, TryStatement,
               SwitchStatement, LabeledStatement, EmptyStatement,
               ImportDeclaration, ExportDeclaration>
      data;
};

struct Program {
  std::string file;
  StatementList body;
};

} // namespace jsgraph::ast
