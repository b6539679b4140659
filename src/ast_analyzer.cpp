#include <jsgraph/ast_analyzer.h>

#include <jsgraph/errors.h>
#include <jsgraph/js_parser.h>
#include <jsgraph/node_factory.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace jsgraph {

std::string ToString(CatchSourceType type) {
  switch (type) {
  case CatchSourceType::kAwaitedCall:
    return "awaited_call";
  case CatchSourceType::kSyncCall:
    return "sync_call";
  case CatchSourceType::kThrowStatement:
    return "throw_statement";
  case CatchSourceType::kConstructorCall:
    return "constructor_call";
  }
  return "unknown";
}

namespace {

enum class ExpressionRole { kValue, kAwaited, kThrown };

struct MemberContext {
  std::string class_name;
  std::string class_id;
  std::vector<std::string> class_scope_path;
};

// State of one function body (or the module body) during the walk.
struct FunctionFrame {
  std::string function_id;
  std::string container_id;
  std::optional<std::size_t> function_index;
  bool is_async = false;
  std::vector<std::string> scope_path;
  std::vector<std::string> class_scope_path;
  BindingFrame bindings;
  std::unordered_map<std::string, std::string> names;
  int try_depth = 0;
  int nesting_depth = 0;
  ControlFlowMetadata control_flow;
};

struct PendingSource {
  std::string source_id;
  CatchSourceType type = CatchSourceType::kSyncCall;
  int line = 0;
};

// Sources gathered for the innermost try body. Barriers stop collection for
// function bodies and try statements without a catch clause.
struct CatchCollector {
  bool barrier = false;
  std::vector<PendingSource> sources;
};

struct ExecutorContext {
  const ast::Function *function = nullptr;
  std::string resolve_name;
  std::string reject_name;
  std::string promise_id;
  std::size_t owner_frame = 0;
};

std::string Segment(const std::string &name, int discriminator) {
  return discriminator > 0 ? name + "#" + std::to_string(discriminator) : name;
}

std::vector<std::string> Extend(std::vector<std::string> path,
                                std::string segment) {
  path.push_back(std::move(segment));
  return path;
}

std::string ExpressionText(const ast::Expression &expression) {
  if (const auto *identifier = std::get_if<ast::Identifier>(&expression.data)) {
    return identifier->name;
  }
  if (std::holds_alternative<ast::ThisExpression>(expression.data)) {
    return "this";
  }
  if (std::holds_alternative<ast::SuperExpression>(expression.data)) {
    return "super";
  }
  if (const auto *member =
          std::get_if<ast::MemberExpression>(&expression.data)) {
    if (member->computed_property || member->property.empty() ||
        !member->object) {
      return "";
    }
    const auto object = ExpressionText(*member->object);
    return object.empty() ? "" : object + "." + member->property;
  }
  return "";
}

void CollectBoundNames(const ast::Pattern &pattern,
                       std::vector<std::string> &names) {
  std::visit(
      [&](const auto &node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::BindingIdentifier>) {
          names.push_back(node.name);
        } else if constexpr (std::is_same_v<T, ast::ObjectPattern>) {
          for (const auto &property : node.properties) {
            if (property.value) {
              CollectBoundNames(*property.value, names);
            }
          }
          if (node.rest) {
            CollectBoundNames(*node.rest, names);
          }
        } else if constexpr (std::is_same_v<T, ast::ArrayPattern>) {
          for (const auto &element : node.elements) {
            if (element) {
              CollectBoundNames(*element, names);
            }
          }
        } else if constexpr (std::is_same_v<T, ast::DefaultPattern> ||
                             std::is_same_v<T, ast::RestPattern>) {
          if (node.target) {
            CollectBoundNames(*node.target, names);
          }
        }
      },
      pattern.data);
}

std::vector<std::string> BoundNames(const ast::Pattern &pattern) {
  std::vector<std::string> names;
  CollectBoundNames(pattern, names);
  return names;
}

Binding BindingFor(const ast::Expression *value) {
  Binding binding;
  if (value == nullptr) {
    return binding;
  }
  if (const auto *construction = std::get_if<ast::NewExpression>(&value->data)) {
    const auto class_name =
        construction->callee ? ExpressionText(*construction->callee) : "";
    if (!class_name.empty()) {
      binding.kind = BindingKind::kConstruction;
      binding.target = class_name;
    }
  } else if (const auto *identifier =
                 std::get_if<ast::Identifier>(&value->data)) {
    binding.kind = BindingKind::kAlias;
    binding.target = identifier->name;
  }
  return binding;
}

const ast::Function *AsFunction(const ast::Expression &expression) {
  const auto *function =
      std::get_if<ast::FunctionExpression>(&expression.data);
  return function != nullptr ? function->function.get() : nullptr;
}

const ast::Class *AsClass(const ast::Expression &expression) {
  const auto *definition = std::get_if<ast::ClassExpression>(&expression.data);
  return definition != nullptr ? definition->definition.get() : nullptr;
}

class FileAnalysis {
public:
  FileAnalysis(std::string file, const AstAnalyzerOptions &options)
      : file_(std::move(file)), options_(options) {}

  FileCollections Run(const ast::Program &program) {
    collections_.file = file_;
    collections_.module = NodeFactory::CreateModule(file_);

    FunctionFrame module_frame;
    module_frame.container_id = collections_.module.id;
    frames_.push_back(std::move(module_frame));
    catch_stack_.push_back({true, {}});

    VisitStatements(program.body);
    return std::move(collections_);
  }

private:
  FunctionFrame &Frame() { return frames_.back(); }

  ScopeContext Context() const { return {file_, frames_.back().scope_path}; }

  int NextDiscriminator(const std::vector<std::string> &scope_path,
                        NodeType type, const std::string &name) {
    std::string key;
    for (const auto &segment : scope_path) {
      key += segment;
      key += "->";
    }
    key += ToString(type);
    key += "->";
    key += name;
    return discriminators_[key]++;
  }

  int NextDiscriminator(NodeType type, const std::string &name) {
    return NextDiscriminator(Frame().scope_path, type, name);
  }

  void Contain(const std::string &child_id) {
    collections_.containment.push_back({Frame().container_id, child_id});
  }

  std::string LookupName(const std::string &name) const {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
      const auto found = frame->names.find(name);
      if (found != frame->names.end()) {
        return found->second;
      }
    }
    return "";
  }

  FunctionFrame *DeclaringFrame(const std::string &name) {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
      if (frame->names.count(name) > 0) {
        return &*frame;
      }
    }
    return nullptr;
  }

  void RecordCatchSource(const std::string &source_id, CatchSourceType type,
                         int line) {
    if (source_id.empty() || catch_stack_.empty() ||
        catch_stack_.back().barrier) {
      return;
    }
    catch_stack_.back().sources.push_back({source_id, type, line});
  }

  void MarkBranch() {
    Frame().control_flow.has_branches = true;
    ++Frame().control_flow.cyclomatic_complexity;
  }

  void MarkLoop() {
    Frame().control_flow.has_loops = true;
    ++Frame().control_flow.cyclomatic_complexity;
  }

  // Declarations.

  std::string DeclareVariable(const std::string &name, const std::string &kind,
                              SourceLocation location,
                              const ast::Expression *init) {
    const auto source_id = init != nullptr ? VisitInitializer(*init, name) : "";

    auto node = NodeFactory::CreateVariableWithContext(
        name, Context(), location.line, location.column, VariableOptions{kind},
        NextDiscriminator(NodeType::kVariable, name));
    const auto id = node.id;
    collections_.variables.push_back(std::move(node));
    variable_ids_.insert(id);
    Contain(id);

    Frame().names[name] = id;
    auto binding = BindingFor(init);
    binding.node_id = id;
    Frame().bindings.Bind(name, std::move(binding));

    RecordDataFlow(id, source_id, init);
    return id;
  }

  void DeclarePattern(const ast::Pattern &pattern, const std::string &kind) {
    VisitPatternExpressions(pattern);
    for (const auto &name : BoundNames(pattern)) {
      auto node = NodeFactory::CreateVariableWithContext(
          name, Context(), pattern.location.line, pattern.location.column,
          VariableOptions{kind}, NextDiscriminator(NodeType::kVariable, name));
      const auto id = node.id;
      collections_.variables.push_back(std::move(node));
      variable_ids_.insert(id);
      Contain(id);
      Frame().names[name] = id;
      Frame().bindings.Bind(name, {BindingKind::kOpaque, "", id});
    }
  }

  void RecordDataFlow(const std::string &variable_id,
                      const std::string &source_id,
                      const ast::Expression *value) {
    if (variable_ids_.count(variable_id) == 0) {
      return;
    }
    if (!source_id.empty()) {
      collections_.assignments.push_back({variable_id, source_id});
    }
    if (value == nullptr) {
      return;
    }
    if (const auto *construction =
            std::get_if<ast::NewExpression>(&value->data)) {
      const auto *callee =
          construction->callee
              ? std::get_if<ast::Identifier>(&construction->callee->data)
              : nullptr;
      if (callee != nullptr) {
        collections_.instantiations.push_back(
            {variable_id, callee->name, Frame().scope_path});
      }
    }
  }

  std::string VisitInitializer(const ast::Expression &value,
                               const std::string &name_hint) {
    if (const auto *function = AsFunction(value)) {
      return VisitFunction(*function, name_hint, nullptr);
    }
    if (const auto *definition = AsClass(value)) {
      return VisitClass(*definition, name_hint);
    }
    return VisitExpression(value);
  }

  void VisitPatternExpressions(const ast::Pattern &pattern) {
    std::visit(
        [&](const auto &node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, ast::ObjectPattern>) {
            for (const auto &property : node.properties) {
              if (property.computed_key) {
                VisitExpression(*property.computed_key);
              }
              if (property.value) {
                VisitPatternExpressions(*property.value);
              }
            }
            if (node.rest) {
              VisitPatternExpressions(*node.rest);
            }
          } else if constexpr (std::is_same_v<T, ast::ArrayPattern>) {
            for (const auto &element : node.elements) {
              if (element) {
                VisitPatternExpressions(*element);
              }
            }
          } else if constexpr (std::is_same_v<T, ast::DefaultPattern>) {
            if (node.target) {
              VisitPatternExpressions(*node.target);
            }
            if (node.value) {
              VisitExpression(*node.value);
            }
          } else if constexpr (std::is_same_v<T, ast::RestPattern>) {
            if (node.target) {
              VisitPatternExpressions(*node.target);
            }
          } else if constexpr (std::is_same_v<T, ast::ExpressionTarget>) {
            if (node.expression) {
              VisitExpression(*node.expression);
            }
          }
        },
        pattern.data);
  }

  // Functions and classes.

  std::string VisitFunction(const ast::Function &function,
                            const std::string &name_hint,
                            const MemberContext *member) {
    const auto name = !function.name.empty() ? function.name
                      : !name_hint.empty()   ? name_hint
                                             : std::string("anonymous");
    const auto declaring_scope =
        member != nullptr ? member->class_scope_path : Frame().scope_path;

    FunctionOptions options;
    options.is_async = function.is_async;
    options.is_generator = function.is_generator;
    options.is_arrow = function.is_arrow;
    options.is_method = function.is_method || member != nullptr;
    if (member != nullptr) {
      options.class_name = member->class_name;
    }
    for (const auto &parameter : function.parameters) {
      if (parameter.target) {
        CollectBoundNames(*parameter.target, options.parameters);
      }
    }

    const auto discriminator =
        NextDiscriminator(declaring_scope, NodeType::kFunction, name);
    auto node = NodeFactory::CreateFunctionWithContext(
        name, ScopeContext{file_, declaring_scope}, function.location.line,
        function.location.column, std::move(options), discriminator);
    const auto id = node.id;
    const auto index = collections_.functions.size();
    collections_.functions.push_back(std::move(node));
    collections_.containment.push_back(
        {member != nullptr ? member->class_id : Frame().container_id, id});

    FunctionFrame frame;
    frame.function_id = id;
    frame.container_id = id;
    frame.function_index = index;
    frame.is_async = function.is_async;
    frame.scope_path = Extend(declaring_scope, Segment(name, discriminator));
    if (member != nullptr) {
      frame.class_scope_path = member->class_scope_path;
    } else if (function.is_arrow) {
      frame.class_scope_path = Frame().class_scope_path;
    }
    frames_.push_back(std::move(frame));
    catch_stack_.push_back({true, {}});

    const bool is_executor =
        pending_executor_ && pending_executor_->function == &function;
    if (is_executor) {
      executors_.push_back(*pending_executor_);
      pending_executor_.reset();
    }

    for (std::size_t i = 0; i < function.parameters.size(); ++i) {
      const auto &parameter = function.parameters[i];
      if (!parameter.target) {
        continue;
      }
      ParameterOptions parameter_options;
      parameter_options.index = static_cast<int>(i);
      parameter_options.is_rest =
          std::holds_alternative<ast::RestPattern>(parameter.target->data);
      parameter_options.has_default =
          std::holds_alternative<ast::DefaultPattern>(parameter.target->data);
      for (const auto &parameter_name : BoundNames(*parameter.target)) {
        auto parameter_node = NodeFactory::CreateParameterWithContext(
            parameter_name, Context(), parameter.location.line,
            parameter.location.column, parameter_options,
            NextDiscriminator(NodeType::kParameter, parameter_name));
        const auto parameter_id = parameter_node.id;
        collections_.parameters.push_back(std::move(parameter_node));
        Contain(parameter_id);
        Frame().names[parameter_name] = parameter_id;
        Frame().bindings.Bind(parameter_name,
                              {BindingKind::kParameter, "", parameter_id});
      }
      VisitPatternExpressions(*parameter.target);
    }

    if (function.expression_body) {
      VisitExpression(*function.expression_body);
    } else {
      VisitStatements(function.body);
    }

    collections_.functions[index].AsFunction()->control_flow =
        Frame().control_flow;
    if (is_executor) {
      executors_.pop_back();
    }
    catch_stack_.pop_back();
    frames_.pop_back();
    return id;
  }

  std::string VisitClass(const ast::Class &definition,
                         const std::string &name_hint) {
    const auto name = !definition.name.empty() ? definition.name
                      : !name_hint.empty()     ? name_hint
                                               : std::string("anonymous");
    std::string super_class;
    if (definition.super_class) {
      super_class = ExpressionText(*definition.super_class);
      if (super_class.empty()) {
        VisitExpression(*definition.super_class);
      }
    }

    const auto discriminator = NextDiscriminator(NodeType::kClass, name);
    auto node = NodeFactory::CreateClassWithContext(
        name, Context(), definition.location.line, definition.location.column,
        ClassOptions{super_class}, discriminator);
    const auto id = node.id;
    collections_.classes.push_back(std::move(node));
    Contain(id);
    Frame().names[name] = id;
    collections_.class_declarations.push_back(
        {id, name, super_class, Frame().scope_path});

    const MemberContext member{
        name, id, Extend(Frame().scope_path, Segment(name, discriminator))};
    for (const auto &entry : definition.members) {
      if (entry.computed_key) {
        VisitExpression(*entry.computed_key);
      }
      const auto key = entry.key.empty() ? std::string("anonymous") : entry.key;
      switch (entry.kind) {
      case ast::ClassMemberKind::kConstructor:
      case ast::ClassMemberKind::kMethod:
      case ast::ClassMemberKind::kGetter:
      case ast::ClassMemberKind::kSetter:
        if (entry.function) {
          VisitFunction(*entry.function, key, &member);
        }
        break;
      case ast::ClassMemberKind::kField:
        if (!entry.value) {
          break;
        }
        if (const auto *function = AsFunction(*entry.value)) {
          VisitFunction(*function, key, &member);
        } else if (const auto *nested = AsClass(*entry.value)) {
          VisitClass(*nested, key);
        } else {
          VisitExpression(*entry.value);
        }
        break;
      case ast::ClassMemberKind::kStaticBlock:
        VisitStatements(entry.static_block);
        break;
      }
    }
    return id;
  }

  // Statements.

  void VisitStatements(const ast::StatementList &statements) {
    for (const auto &statement : statements) {
      if (statement) {
        VisitStatement(*statement);
      }
    }
  }

  void VisitStatement(const ast::Statement &statement) {
    std::visit([&](const auto &node) { Visit(node, statement.location); },
               statement.data);
  }

  void VisitNested(const ast::StatementPtr &statement) {
    if (!statement) {
      return;
    }
    ++Frame().nesting_depth;
    VisitStatement(*statement);
    --Frame().nesting_depth;
  }

  void VisitNested(const ast::StatementList &statements) {
    ++Frame().nesting_depth;
    VisitStatements(statements);
    --Frame().nesting_depth;
  }

  void Visit(const ast::VariableDeclaration &declaration, SourceLocation) {
    for (const auto &declarator : declaration.declarators) {
      if (!declarator.target) {
        continue;
      }
      if (const auto *binding =
              std::get_if<ast::BindingIdentifier>(&declarator.target->data)) {
        DeclareVariable(binding->name, declaration.kind, declarator.location,
                        declarator.init.get());
        continue;
      }
      if (declarator.init) {
        VisitExpression(*declarator.init);
      }
      DeclarePattern(*declarator.target, declaration.kind);
    }
  }

  void Visit(const ast::FunctionDeclaration &declaration, SourceLocation) {
    if (!declaration.function) {
      return;
    }
    const auto id = VisitFunction(*declaration.function, "", nullptr);
    if (!declaration.function->name.empty()) {
      Frame().names[declaration.function->name] = id;
    }
  }

  void Visit(const ast::ClassDeclaration &declaration, SourceLocation) {
    if (declaration.definition) {
      VisitClass(*declaration.definition, "");
    }
  }

  void Visit(const ast::ExpressionStatement &statement, SourceLocation) {
    if (statement.expression) {
      VisitExpression(*statement.expression);
    }
  }

  void Visit(const ast::BlockStatement &block, SourceLocation) {
    VisitStatements(block.body);
  }

  void Visit(const ast::IfStatement &statement, SourceLocation) {
    MarkBranch();
    if (statement.test) {
      VisitExpression(*statement.test);
    }
    VisitNested(statement.consequent);
    VisitNested(statement.alternate);
  }

  void Visit(const ast::ForStatement &statement, SourceLocation) {
    MarkLoop();
    if (statement.init) {
      VisitStatement(*statement.init);
    }
    if (statement.test) {
      VisitExpression(*statement.test);
    }
    if (statement.update) {
      VisitExpression(*statement.update);
    }
    VisitNested(statement.body);
  }

  void Visit(const ast::ForInOfStatement &statement, SourceLocation) {
    MarkLoop();
    if (statement.right) {
      VisitExpression(*statement.right, statement.is_await
                                            ? ExpressionRole::kAwaited
                                            : ExpressionRole::kValue);
    }
    if (statement.target) {
      if (!statement.declaration_kind.empty()) {
        DeclarePattern(*statement.target, statement.declaration_kind);
      } else {
        VisitPatternExpressions(*statement.target);
      }
    }
    VisitNested(statement.body);
  }

  void Visit(const ast::WhileStatement &statement, SourceLocation) {
    MarkLoop();
    if (statement.test) {
      VisitExpression(*statement.test);
    }
    VisitNested(statement.body);
  }

  void Visit(const ast::DoWhileStatement &statement, SourceLocation) {
    MarkLoop();
    VisitNested(statement.body);
    if (statement.test) {
      VisitExpression(*statement.test);
    }
  }

  void Visit(const ast::ReturnStatement &statement, SourceLocation) {
    if (Frame().nesting_depth > 0) {
      Frame().control_flow.has_early_return = true;
    }
    if (statement.argument) {
      VisitExpression(*statement.argument);
    }
  }

  void Visit(const ast::ThrowStatement &statement, SourceLocation location) {
    const bool in_function = Frame().function_index.has_value();
    const bool is_async = Frame().is_async;
    if (in_function) {
      auto &control_flow = Frame().control_flow;
      if (is_async) {
        control_flow.can_reject = true;
        control_flow.has_async_throw = true;
      } else {
        control_flow.has_throw = true;
      }
    }
    if (!statement.argument) {
      return;
    }

    const auto &argument = *statement.argument;
    std::optional<RejectionPattern> pattern;
    if (in_function) {
      pattern = Classify(&argument, {&Frame().bindings},
                         is_async ? RejectionType::kDirectConstructInAsyncThrow
                                  : RejectionType::kDirectConstructInSyncThrow,
                         Frame().function_id, location);
    }

    std::string source_id;
    if (const auto *identifier = std::get_if<ast::Identifier>(&argument.data)) {
      source_id = LookupName(identifier->name);
    } else {
      source_id = VisitExpression(argument, ExpressionRole::kThrown);
    }

    if (pattern) {
      pattern->is_async = is_async;
      collections_.rejection_patterns.push_back(std::move(*pattern));
    }
    RecordCatchSource(source_id, CatchSourceType::kThrowStatement,
                      location.line);
  }

  void Visit(const ast::JumpStatement &, SourceLocation) {}

  void Visit(const ast::TryStatement &statement, SourceLocation location) {
    const bool has_handler = statement.handler.has_value();
    auto try_node = NodeFactory::CreateTryBlockWithContext(
        Context(), location.line, location.column,
        NextDiscriminator(NodeType::kTryBlock, "try"));
    const auto try_id = try_node.id;
    collections_.blocks.push_back(std::move(try_node));
    Contain(try_id);

    if (has_handler) {
      Frame().control_flow.has_try_catch = true;
      ++Frame().control_flow.cyclomatic_complexity;
      ++Frame().try_depth;
    }
    catch_stack_.push_back({!has_handler, {}});
    VisitNested(statement.block);
    auto collector = std::move(catch_stack_.back());
    catch_stack_.pop_back();
    if (has_handler) {
      --Frame().try_depth;
      VisitCatch(*statement.handler, try_id, collector);
    }

    if (statement.finalizer) {
      const auto &finalizer = *statement.finalizer;
      auto finally_node = NodeFactory::CreateFinallyBlockWithContext(
          Context(), finalizer.location.line, finalizer.location.column,
          try_id, NextDiscriminator(NodeType::kFinallyBlock, "finally"));
      const auto finally_id = finally_node.id;
      collections_.blocks.push_back(std::move(finally_node));
      Contain(finally_id);
      VisitNested(finalizer.body);
    }
  }

  void VisitCatch(const ast::CatchClause &handler, const std::string &try_id,
                  const CatchCollector &collector) {
    std::string parameter_name;
    if (handler.parameter) {
      if (const auto *binding =
              std::get_if<ast::BindingIdentifier>(&handler.parameter->data)) {
        parameter_name = binding->name;
      }
    }

    auto node = NodeFactory::CreateCatchBlockWithContext(
        Context(), handler.location.line, handler.location.column,
        CatchBlockOptions{parameter_name, try_id},
        NextDiscriminator(NodeType::kCatchBlock, "catch"));
    const auto catch_id = node.id;
    collections_.blocks.push_back(std::move(node));
    Contain(catch_id);
    for (const auto &source : collector.sources) {
      collections_.catches_from.push_back(
          {catch_id, parameter_name, source.source_id, source.type,
           source.line});
    }

    std::optional<std::string> shadowed_name;
    std::optional<Binding> shadowed_binding;
    if (!parameter_name.empty()) {
      auto &frame = Frame();
      if (const auto found = frame.names.find(parameter_name);
          found != frame.names.end()) {
        shadowed_name = found->second;
      }
      if (const auto *binding = frame.bindings.Find(parameter_name)) {
        shadowed_binding = *binding;
      }
      frame.names[parameter_name] = catch_id;
      frame.bindings.Bind(parameter_name,
                          {BindingKind::kOpaque, "", catch_id});
    } else if (handler.parameter) {
      DeclarePattern(*handler.parameter, "let");
    }

    VisitNested(handler.body);

    if (!parameter_name.empty()) {
      auto &frame = Frame();
      if (shadowed_name) {
        frame.names[parameter_name] = *shadowed_name;
      } else {
        frame.names.erase(parameter_name);
      }
      if (shadowed_binding) {
        frame.bindings.Bind(parameter_name, *shadowed_binding);
      } else {
        frame.bindings.Unbind(parameter_name);
      }
    }
  }

  void Visit(const ast::SwitchStatement &statement, SourceLocation) {
    Frame().control_flow.has_branches = true;
    if (statement.discriminant) {
      VisitExpression(*statement.discriminant);
    }
    for (const auto &entry : statement.cases) {
      if (entry.test) {
        ++Frame().control_flow.cyclomatic_complexity;
        VisitExpression(*entry.test);
      }
      VisitNested(entry.body);
    }
  }

  void Visit(const ast::LabeledStatement &statement, SourceLocation) {
    if (statement.body) {
      VisitStatement(*statement.body);
    }
  }

  void Visit(const ast::EmptyStatement &, SourceLocation) {}

  void Visit(const ast::ImportDeclaration &declaration, SourceLocation) {
    for (const auto &specifier : declaration.specifiers) {
      auto node = NodeFactory::CreateImportWithContext(
          specifier.local, Context(), specifier.location.line,
          specifier.location.column,
          ImportOptions{declaration.source, specifier.imported},
          NextDiscriminator(NodeType::kImport, specifier.local));
      const auto id = node.id;
      collections_.imports.push_back(std::move(node));
      Contain(id);
      Frame().names[specifier.local] = id;
      Frame().bindings.Bind(specifier.local, {BindingKind::kOpaque, "", id});
    }
  }

  void Visit(const ast::ExportDeclaration &declaration,
             SourceLocation location) {
    switch (declaration.kind) {
    case ast::ExportKind::kNamed:
      for (const auto &specifier : declaration.specifiers) {
        AddExport(specifier.exported, specifier.local, declaration.source,
                  specifier.location);
      }
      break;
    case ast::ExportKind::kAll:
      AddExport(declaration.alias.empty() ? "*" : declaration.alias, "*",
                declaration.source, location);
      break;
    case ast::ExportKind::kDefault:
      AddExport("default", VisitDefaultExport(declaration), "", location);
      break;
    case ast::ExportKind::kDeclaration:
      if (declaration.declaration) {
        VisitStatement(*declaration.declaration);
        for (const auto &name : DeclaredNames(*declaration.declaration)) {
          AddExport(name, name, "", location);
        }
      }
      break;
    }
  }

  std::string VisitDefaultExport(const ast::ExportDeclaration &declaration) {
    if (declaration.declaration) {
      const auto &statement = *declaration.declaration;
      if (const auto *function =
              std::get_if<ast::FunctionDeclaration>(&statement.data)) {
        if (function->function) {
          VisitFunction(*function->function, "default", nullptr);
          return function->function->name.empty() ? "default"
                                                  : function->function->name;
        }
      } else if (const auto *definition =
                     std::get_if<ast::ClassDeclaration>(&statement.data)) {
        if (definition->definition) {
          VisitClass(*definition->definition, "default");
          return definition->definition->name.empty()
                     ? "default"
                     : definition->definition->name;
        }
      }
      VisitStatement(statement);
      return "";
    }
    if (!declaration.expression) {
      return "";
    }
    const auto &expression = *declaration.expression;
    if (const auto *function = AsFunction(expression)) {
      VisitFunction(*function, "default", nullptr);
      return function->name.empty() ? "default" : function->name;
    }
    if (const auto *definition = AsClass(expression)) {
      VisitClass(*definition, "default");
      return definition->name.empty() ? "default" : definition->name;
    }
    VisitExpression(expression);
    if (const auto *identifier =
            std::get_if<ast::Identifier>(&expression.data)) {
      return identifier->name;
    }
    return "";
  }

  std::vector<std::string> DeclaredNames(const ast::Statement &statement) {
    std::vector<std::string> names;
    if (const auto *function =
            std::get_if<ast::FunctionDeclaration>(&statement.data)) {
      if (function->function && !function->function->name.empty()) {
        names.push_back(function->function->name);
      }
    } else if (const auto *definition =
                   std::get_if<ast::ClassDeclaration>(&statement.data)) {
      if (definition->definition && !definition->definition->name.empty()) {
        names.push_back(definition->definition->name);
      }
    } else if (const auto *variables =
                   std::get_if<ast::VariableDeclaration>(&statement.data)) {
      for (const auto &declarator : variables->declarators) {
        if (declarator.target) {
          CollectBoundNames(*declarator.target, names);
        }
      }
    }
    return names;
  }

  void AddExport(const std::string &exported, const std::string &local,
                 const std::string &source, SourceLocation location) {
    ExportOptions options;
    options.local = local;
    options.source = source;
    options.is_default = exported == "default";
    auto node = NodeFactory::CreateExportWithContext(
        exported, Context(), location.line, location.column, options,
        NextDiscriminator(NodeType::kExport, exported));
    const auto id = node.id;
    collections_.exports.push_back(std::move(node));
    Contain(id);
  }

  // Expressions. Each returns the ID of the node the expression produced,
  // or an empty string.

  std::string VisitExpression(const ast::Expression &expression,
                              ExpressionRole role = ExpressionRole::kValue) {
    return std::visit(
        [&](const auto &node) { return Visit(node, expression.location, role); },
        expression.data);
  }

  std::string Visit(const ast::Identifier &identifier, SourceLocation,
                    ExpressionRole) {
    return LookupName(identifier.name);
  }

  std::string Visit(const ast::Literal &, SourceLocation, ExpressionRole) {
    return "";
  }

  std::string Visit(const ast::TemplateLiteral &literal, SourceLocation,
                    ExpressionRole) {
    if (literal.tag) {
      VisitExpression(*literal.tag);
    }
    for (const auto &substitution : literal.substitutions) {
      if (substitution) {
        VisitExpression(*substitution);
      }
    }
    return "";
  }

  std::string Visit(const ast::ThisExpression &, SourceLocation,
                    ExpressionRole) {
    return "";
  }

  std::string Visit(const ast::SuperExpression &, SourceLocation,
                    ExpressionRole) {
    return "";
  }

  std::string Visit(const ast::MetaProperty &, SourceLocation,
                    ExpressionRole) {
    return "";
  }

  std::string Visit(const ast::ArrayLiteral &literal, SourceLocation location,
                    ExpressionRole) {
    int entries = 0;
    for (const auto &element : literal.elements) {
      if (element) {
        ++entries;
      }
    }
    auto node = NodeFactory::CreateArrayLiteralWithContext(
        Context(), location.line, location.column, LiteralOptions{entries},
        NextDiscriminator(NodeType::kArrayLiteral, "array"));
    const auto id = node.id;
    collections_.literals.push_back(std::move(node));
    Contain(id);
    for (const auto &element : literal.elements) {
      if (element) {
        VisitExpression(*element);
      }
    }
    return id;
  }

  std::string Visit(const ast::ObjectLiteral &literal, SourceLocation location,
                    ExpressionRole) {
    auto node = NodeFactory::CreateObjectLiteralWithContext(
        Context(), location.line, location.column,
        LiteralOptions{static_cast<int>(literal.properties.size())},
        NextDiscriminator(NodeType::kObjectLiteral, "object"));
    const auto id = node.id;
    collections_.literals.push_back(std::move(node));
    Contain(id);
    for (const auto &property : literal.properties) {
      if (property.computed_key) {
        VisitExpression(*property.computed_key);
      }
      if (property.value) {
        VisitInitializer(*property.value, property.key);
      }
    }
    return id;
  }

  std::string Visit(const ast::FunctionExpression &expression, SourceLocation,
                    ExpressionRole) {
    return expression.function ? VisitFunction(*expression.function, "", nullptr)
                               : "";
  }

  std::string Visit(const ast::ClassExpression &expression, SourceLocation,
                    ExpressionRole) {
    return expression.definition ? VisitClass(*expression.definition, "") : "";
  }

  std::string Visit(const ast::UnaryExpression &expression, SourceLocation,
                    ExpressionRole) {
    if (expression.operand) {
      VisitExpression(*expression.operand);
    }
    return "";
  }

  std::string Visit(const ast::UpdateExpression &expression, SourceLocation,
                    ExpressionRole) {
    if (expression.operand) {
      VisitExpression(*expression.operand);
    }
    return "";
  }

  std::string Visit(const ast::BinaryExpression &expression, SourceLocation,
                    ExpressionRole) {
    if (expression.op == "&&" || expression.op == "||" ||
        expression.op == "??") {
      ++Frame().control_flow.cyclomatic_complexity;
    }
    if (expression.left) {
      VisitExpression(*expression.left);
    }
    if (expression.right) {
      VisitExpression(*expression.right);
    }
    return "";
  }

  std::string Visit(const ast::ConditionalExpression &expression,
                    SourceLocation, ExpressionRole) {
    MarkBranch();
    if (expression.test) {
      VisitExpression(*expression.test);
    }
    if (expression.consequent) {
      VisitExpression(*expression.consequent);
    }
    if (expression.alternate) {
      VisitExpression(*expression.alternate);
    }
    return "";
  }

  std::string Visit(const ast::AssignmentExpression &assignment,
                    SourceLocation, ExpressionRole) {
    if (!assignment.target) {
      return assignment.value ? VisitExpression(*assignment.value) : "";
    }
    const auto *binding =
        std::get_if<ast::BindingIdentifier>(&assignment.target->data);
    std::string source_id;
    if (assignment.value) {
      source_id = binding != nullptr
                      ? VisitInitializer(*assignment.value, binding->name)
                      : VisitExpression(*assignment.value);
    }

    if (binding == nullptr) {
      VisitPatternExpressions(*assignment.target);
      for (const auto &name : BoundNames(*assignment.target)) {
        auto *owner = DeclaringFrame(name);
        (owner != nullptr ? owner : &Frame())
            ->bindings.Bind(name, {BindingKind::kOpaque, "", LookupName(name)});
      }
      return source_id;
    }

    auto *owner = DeclaringFrame(binding->name);
    if (owner == nullptr) {
      owner = &Frame();
    }
    auto rebound = assignment.op == "=" ? BindingFor(assignment.value.get())
                                        : Binding{};
    rebound.node_id = LookupName(binding->name);
    owner->bindings.Bind(binding->name, rebound);
    if (assignment.op == "=") {
      RecordDataFlow(rebound.node_id, source_id, assignment.value.get());
    }
    return source_id;
  }

  std::string Visit(const ast::SequenceExpression &expression, SourceLocation,
                    ExpressionRole) {
    std::string last;
    for (const auto &entry : expression.expressions) {
      if (entry) {
        last = VisitExpression(*entry);
      }
    }
    return last;
  }

  std::string Visit(const ast::MemberExpression &expression, SourceLocation,
                    ExpressionRole) {
    if (expression.object) {
      VisitExpression(*expression.object);
    }
    if (expression.computed_property) {
      VisitExpression(*expression.computed_property);
    }
    return "";
  }

  std::string Visit(const ast::CallExpression &call, SourceLocation location,
                    ExpressionRole role) {
    std::string name;
    std::string object;
    std::string method;
    const ast::Identifier *plain = nullptr;
    if (call.callee) {
      const auto &callee = *call.callee;
      plain = std::get_if<ast::Identifier>(&callee.data);
      const auto *member = std::get_if<ast::MemberExpression>(&callee.data);
      if (plain != nullptr) {
        name = plain->name;
      } else if (member != nullptr && !member->computed_property &&
                 !member->property.empty()) {
        if (member->object) {
          VisitExpression(*member->object);
          object = ExpressionText(*member->object);
        }
        method = member->property;
        name = object.empty() ? method : object + "." + method;
      } else if (std::holds_alternative<ast::SuperExpression>(callee.data)) {
        name = "super";
      } else {
        VisitExpression(callee);
      }
    }
    if (name.empty()) {
      name = "anonymous";
    }

    CallOptions options;
    options.object = object;
    options.method = method;
    options.is_awaited = role == ExpressionRole::kAwaited;
    options.is_inside_try = Frame().try_depth > 0;
    options.argument_count = static_cast<int>(call.arguments.size());
    auto node = NodeFactory::CreateCallWithContext(
        name, Context(), location.line, location.column, options,
        NextDiscriminator(NodeType::kCall, name));
    const auto id = node.id;
    collections_.calls.push_back(std::move(node));
    Contain(id);

    if (plain != nullptr) {
      collections_.call_sites.push_back(
          {id, plain->name, false, Frame().scope_path, {}});
    } else if (object == "this" && !Frame().class_scope_path.empty()) {
      collections_.call_sites.push_back(
          {id, method, true, Frame().scope_path, Frame().class_scope_path});
    }

    if (role != ExpressionRole::kThrown) {
      RecordCatchSource(id,
                        options.is_awaited ? CatchSourceType::kAwaitedCall
                                           : CatchSourceType::kSyncCall,
                        location.line);
    }

    const ast::Expression *first_argument =
        call.arguments.empty() ? nullptr : call.arguments.front().get();
    if (object == "Promise" && method == "reject") {
      RecordStaticReject(first_argument, location);
    } else if (plain != nullptr) {
      RecordSettlement(plain->name, id, first_argument, location);
    }

    for (const auto &argument : call.arguments) {
      if (argument) {
        VisitExpression(*argument);
      }
    }
    return id;
  }

  std::string Visit(const ast::NewExpression &expression,
                    SourceLocation location, ExpressionRole role) {
    std::string class_name;
    if (expression.callee) {
      class_name = ExpressionText(*expression.callee);
      if (class_name.empty()) {
        VisitExpression(*expression.callee);
      }
    }
    if (class_name.empty()) {
      class_name = "anonymous";
    }

    auto node = NodeFactory::CreateConstructorCallWithContext(
        class_name, Context(), location.line, location.column,
        ConstructorCallOptions{static_cast<int>(expression.arguments.size())},
        NextDiscriminator(NodeType::kConstructorCall, class_name));
    const auto id = node.id;
    collections_.constructor_calls.push_back(std::move(node));
    Contain(id);
    if (role != ExpressionRole::kThrown) {
      RecordCatchSource(id, CatchSourceType::kConstructorCall, location.line);
    }

    if (class_name == "Promise" && !expression.arguments.empty() &&
        expression.arguments.front()) {
      const auto *executor = AsFunction(*expression.arguments.front());
      if (executor != nullptr && !executor->parameters.empty()) {
        ExecutorContext context;
        context.function = executor;
        context.resolve_name = ParameterName(*executor, 0);
        context.reject_name = ParameterName(*executor, 1);
        context.promise_id = id;
        context.owner_frame = frames_.size() - 1;
        pending_executor_ = context;
      }
    }

    for (const auto &argument : expression.arguments) {
      if (argument) {
        VisitExpression(*argument);
      }
    }
    pending_executor_.reset();
    return id;
  }

  std::string Visit(const ast::SpreadElement &expression, SourceLocation,
                    ExpressionRole) {
    return expression.argument ? VisitExpression(*expression.argument) : "";
  }

  std::string Visit(const ast::AwaitExpression &expression, SourceLocation,
                    ExpressionRole) {
    return expression.argument
               ? VisitExpression(*expression.argument, ExpressionRole::kAwaited)
               : "";
  }

  std::string Visit(const ast::YieldExpression &expression, SourceLocation,
                    ExpressionRole) {
    if (expression.argument) {
      VisitExpression(*expression.argument);
    }
    return "";
  }

  std::string Visit(const ast::ImportCall &expression, SourceLocation,
                    ExpressionRole) {
    if (expression.source) {
      VisitExpression(*expression.source);
    }
    return "";
  }

  std::string Visit(const ast::JsxElement &element, SourceLocation,
                    ExpressionRole) {
    for (const auto &expression : element.expressions) {
      if (expression) {
        VisitExpression(*expression);
      }
    }
    return "";
  }

  // Rejections.

  static std::string ParameterName(const ast::Function &function,
                                   std::size_t index) {
    if (index >= function.parameters.size() ||
        !function.parameters[index].target) {
      return "";
    }
    const auto *binding = std::get_if<ast::BindingIdentifier>(
        &function.parameters[index].target->data);
    return binding != nullptr ? binding->name : "";
  }

  std::optional<RejectionPattern>
  Classify(const ast::Expression *argument,
           const std::vector<const BindingFrame *> &frames,
           RejectionType direct_type, const std::string &function_id,
           SourceLocation location) const {
    if (argument == nullptr) {
      return std::nullopt;
    }
    RejectionPattern pattern;
    pattern.function_id = function_id;
    pattern.file = file_;
    pattern.line = location.line;
    pattern.column = location.column;

    if (const auto *construction =
            std::get_if<ast::NewExpression>(&argument->data)) {
      const auto class_name =
          construction->callee ? ExpressionText(*construction->callee) : "";
      if (class_name.empty()) {
        return std::nullopt;
      }
      pattern.error_class_name = class_name;
      pattern.rejection_type = direct_type;
      return pattern;
    }

    const auto *identifier = std::get_if<ast::Identifier>(&argument->data);
    if (identifier == nullptr) {
      return std::nullopt;
    }
    auto trace =
        TraceIdentifier(identifier->name, frames, options_.max_trace_hops);
    pattern.source_variable_name = identifier->name;
    pattern.trace_path = std::move(trace.path);
    switch (trace.outcome) {
    case TraceOutcome::kResolved:
      pattern.rejection_type = RejectionType::kTracedLocalVariable;
      pattern.error_class_name = trace.class_name;
      break;
    case TraceOutcome::kParameter:
      pattern.rejection_type = RejectionType::kUnresolvedParameter;
      break;
    case TraceOutcome::kUnresolved:
      pattern.rejection_type = RejectionType::kUnresolvedVariable;
      break;
    }
    return pattern;
  }

  void RecordStaticReject(const ast::Expression *argument,
                          SourceLocation location) {
    auto &frame = Frame();
    if (!frame.function_index) {
      return;
    }
    frame.control_flow.can_reject = true;
    auto pattern = Classify(argument, {&frame.bindings},
                            RejectionType::kDirectConstructInStaticReject,
                            frame.function_id, location);
    if (pattern) {
      collections_.rejection_patterns.push_back(std::move(*pattern));
    }
  }

  void RecordSettlement(const std::string &callee, const std::string &call_id,
                        const ast::Expression *argument,
                        SourceLocation location) {
    for (auto context = executors_.rbegin(); context != executors_.rend();
         ++context) {
      const bool is_reject = callee == context->reject_name;
      if (!is_reject && callee != context->resolve_name) {
        continue;
      }
      collections_.promise_settlements.push_back(
          {call_id, context->promise_id, is_reject});
      auto &owner = frames_[context->owner_frame];
      if (!is_reject || !owner.function_index) {
        return;
      }
      owner.control_flow.can_reject = true;
      std::vector<const BindingFrame *> closure;
      for (auto index = frames_.size(); index-- > context->owner_frame;) {
        closure.push_back(&frames_[index].bindings);
      }
      auto pattern =
          Classify(argument, closure, RejectionType::kDirectConstructInRejectCall,
                   owner.function_id, location);
      if (pattern) {
        collections_.rejection_patterns.push_back(std::move(*pattern));
      }
      return;
    }
  }

  std::string file_;
  const AstAnalyzerOptions &options_;
  FileCollections collections_;
  std::vector<FunctionFrame> frames_;
  std::vector<CatchCollector> catch_stack_;
  std::vector<ExecutorContext> executors_;
  std::optional<ExecutorContext> pending_executor_;
  std::unordered_map<std::string, int> discriminators_;
  std::unordered_set<std::string> variable_ids_;
};

std::string ReadFile(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw std::runtime_error("Unable to read source file: " + path);
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

} // namespace

AstAnalyzer::AstAnalyzer(AstAnalyzerOptions options) : options_(options) {}

FileCollections AstAnalyzer::Analyze(const SourceFile &file) const {
  const auto &name =
      file.relative_path.empty() ? file.path : file.relative_path;
  return AnalyzeSource(ReadFile(file.path), name);
}

FileCollections AstAnalyzer::AnalyzeSource(std::string_view source,
                                           const std::string &file) const {
  return AnalyzeProgram(ParseModule(source, file));
}

FileCollections AstAnalyzer::AnalyzeProgram(const ast::Program &program) const {
  return FileAnalysis(program.file, options_).Run(program);
}

} // namespace jsgraph
