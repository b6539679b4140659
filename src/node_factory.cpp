#include <jsgraph/node_factory.h>

#include <jsgraph/errors.h>

#include <utility>

namespace jsgraph {
namespace {

constexpr const char kModuleName[] = "module";
constexpr const char kObjectLiteralName[] = "object";
constexpr const char kArrayLiteralName[] = "array";
constexpr const char kTryBlockName[] = "try";
constexpr const char kCatchBlockName[] = "catch";
constexpr const char kFinallyBlockName[] = "finally";

void Validate(NodeType type, const std::string &name, const std::string &file,
              int line) {
  const auto kind = ToString(type);
  if (name.empty()) {
    throw ValidationError(kind + " node requires a name");
  }
  if (file.empty()) {
    throw ValidationError(kind + " node '" + name + "' requires a file");
  }
  if (line < 0) {
    throw ValidationError(kind + " node '" + name + "' in " + file +
                          " requires a line");
  }
}

std::string ScopeSegment(const std::vector<std::string> &scope_path) {
  if (scope_path.empty()) {
    return "global";
  }
  std::string joined;
  for (std::size_t i = 0; i < scope_path.size(); ++i) {
    if (i > 0) {
      joined += "->";
    }
    joined += scope_path[i];
  }
  return joined;
}

std::string ContextId(NodeType type, const std::string &name,
                      const ScopeContext &context, int discriminator) {
  if (discriminator < 0) {
    throw ValidationError(ToString(type) + " node '" + name +
                          "' has a negative discriminator");
  }
  auto id = context.file + "->" + ScopeSegment(context.scope_path) + "->" +
            ToString(type) + "->" + name;
  if (discriminator > 0) {
    id += "#" + std::to_string(discriminator);
  }
  return id;
}

std::string PositionalId(NodeType type, const std::string &name,
                         const std::string &file, int line, int column) {
  return ToString(type) + "#" + name + "#" + file + "#" +
         std::to_string(line) + ":" + std::to_string(column);
}

NodeRecord MakeRecord(std::string id, NodeType type, const std::string &name,
                      const std::string &file, int line, int column,
                      NodeAttributes attributes) {
  NodeRecord record;
  record.id = std::move(id);
  record.type = type;
  record.name = name;
  record.file = file;
  record.line = line;
  record.column = column < 0 ? kUnknownPosition : column;
  record.attributes = std::move(attributes);
  return record;
}

NodeRecord CreatePositional(NodeType type, const std::string &name,
                            const std::string &file, int line, int column,
                            NodeAttributes attributes) {
  Validate(type, name, file, line);
  const auto normalized_column = column < 0 ? kUnknownPosition : column;
  return MakeRecord(PositionalId(type, name, file, line, normalized_column),
                    type, name, file, line, normalized_column,
                    std::move(attributes));
}

NodeRecord CreateContextual(NodeType type, const std::string &name,
                            const ScopeContext &context, int line, int column,
                            int discriminator, NodeAttributes attributes) {
  Validate(type, name, context.file, line);
  return MakeRecord(ContextId(type, name, context, discriminator), type, name,
                    context.file, line, column, std::move(attributes));
}

FunctionAttributes ToAttributes(FunctionOptions options) {
  FunctionAttributes attributes;
  attributes.is_async = options.is_async;
  attributes.is_generator = options.is_generator;
  attributes.is_arrow = options.is_arrow;
  attributes.is_method = options.is_method;
  attributes.class_name = std::move(options.class_name);
  attributes.parameters = std::move(options.parameters);
  return attributes;
}

CallAttributes ToAttributes(CallOptions options) {
  CallAttributes attributes;
  attributes.object = std::move(options.object);
  attributes.method = std::move(options.method);
  attributes.is_method_call = !attributes.method.empty();
  attributes.is_awaited = options.is_awaited;
  attributes.is_inside_try = options.is_inside_try;
  attributes.argument_count = options.argument_count;
  return attributes;
}

ImportAttributes ToAttributes(const std::string &local,
                              ImportOptions options) {
  ImportAttributes attributes;
  attributes.source = std::move(options.source);
  attributes.imported =
      options.imported.empty() ? local : std::move(options.imported);
  attributes.local = local;
  return attributes;
}

ExportAttributes ToAttributes(const std::string &exported,
                              ExportOptions options) {
  ExportAttributes attributes;
  attributes.exported = exported;
  attributes.local = std::move(options.local);
  attributes.source = std::move(options.source);
  attributes.is_default = options.is_default || exported == "default";
  return attributes;
}

} // namespace

NodeRecord NodeFactory::CreateModule(const std::string &file) {
  return CreateContextual(NodeType::kModule, kModuleName,
                          ScopeContext{file, {}}, kUnknownPosition,
                          kUnknownPosition, 0, std::monostate{});
}

NodeRecord NodeFactory::CreateFunction(const std::string &name,
                                       const std::string &file, int line,
                                       int column, FunctionOptions options) {
  return CreatePositional(NodeType::kFunction, name, file, line, column,
                          ToAttributes(std::move(options)));
}

NodeRecord NodeFactory::CreateFunctionWithContext(const std::string &name,
                                                  const ScopeContext &context,
                                                  int line, int column,
                                                  FunctionOptions options,
                                                  int discriminator) {
  return CreateContextual(NodeType::kFunction, name, context, line, column,
                          discriminator, ToAttributes(std::move(options)));
}

NodeRecord NodeFactory::CreateClass(const std::string &name,
                                    const std::string &file, int line,
                                    int column, ClassOptions options) {
  return CreatePositional(NodeType::kClass, name, file, line, column,
                          ClassAttributes{std::move(options.super_class)});
}

NodeRecord NodeFactory::CreateClassWithContext(const std::string &name,
                                               const ScopeContext &context,
                                               int line, int column,
                                               ClassOptions options,
                                               int discriminator) {
  return CreateContextual(NodeType::kClass, name, context, line, column,
                          discriminator,
                          ClassAttributes{std::move(options.super_class)});
}

NodeRecord NodeFactory::CreateCall(const std::string &name,
                                   const std::string &file, int line,
                                   int column, CallOptions options) {
  return CreatePositional(NodeType::kCall, name, file, line, column,
                          ToAttributes(std::move(options)));
}

NodeRecord NodeFactory::CreateCallWithContext(const std::string &name,
                                              const ScopeContext &context,
                                              int line, int column,
                                              CallOptions options,
                                              int discriminator) {
  return CreateContextual(NodeType::kCall, name, context, line, column,
                          discriminator, ToAttributes(std::move(options)));
}

NodeRecord NodeFactory::CreateConstructorCall(const std::string &class_name,
                                              const std::string &file,
                                              int line, int column,
                                              ConstructorCallOptions options) {
  return CreatePositional(
      NodeType::kConstructorCall, class_name, file, line, column,
      ConstructorCallAttributes{class_name, options.argument_count});
}

NodeRecord NodeFactory::CreateConstructorCallWithContext(
    const std::string &class_name, const ScopeContext &context, int line,
    int column, ConstructorCallOptions options, int discriminator) {
  return CreateContextual(
      NodeType::kConstructorCall, class_name, context, line, column,
      discriminator,
      ConstructorCallAttributes{class_name, options.argument_count});
}

NodeRecord NodeFactory::CreateObjectLiteral(const std::string &file, int line,
                                            int column,
                                            LiteralOptions options) {
  return CreatePositional(NodeType::kObjectLiteral, kObjectLiteralName, file,
                          line, column, LiteralAttributes{options.entry_count});
}

NodeRecord NodeFactory::CreateObjectLiteralWithContext(
    const ScopeContext &context, int line, int column, LiteralOptions options,
    int discriminator) {
  return CreateContextual(NodeType::kObjectLiteral, kObjectLiteralName,
                          context, line, column, discriminator,
                          LiteralAttributes{options.entry_count});
}

NodeRecord NodeFactory::CreateArrayLiteral(const std::string &file, int line,
                                           int column,
                                           LiteralOptions options) {
  return CreatePositional(NodeType::kArrayLiteral, kArrayLiteralName, file,
                          line, column, LiteralAttributes{options.entry_count});
}

NodeRecord NodeFactory::CreateArrayLiteralWithContext(
    const ScopeContext &context, int line, int column, LiteralOptions options,
    int discriminator) {
  return CreateContextual(NodeType::kArrayLiteral, kArrayLiteralName, context,
                          line, column, discriminator,
                          LiteralAttributes{options.entry_count});
}

NodeRecord NodeFactory::CreateVariable(const std::string &name,
                                       const std::string &file, int line,
                                       int column, VariableOptions options) {
  return CreatePositional(NodeType::kVariable, name, file, line, column,
                          VariableAttributes{std::move(options.kind)});
}

NodeRecord NodeFactory::CreateVariableWithContext(const std::string &name,
                                                  const ScopeContext &context,
                                                  int line, int column,
                                                  VariableOptions options,
                                                  int discriminator) {
  return CreateContextual(NodeType::kVariable, name, context, line, column,
                          discriminator,
                          VariableAttributes{std::move(options.kind)});
}

NodeRecord NodeFactory::CreateParameter(const std::string &name,
                                        const std::string &file, int line,
                                        int column, ParameterOptions options) {
  return CreatePositional(NodeType::kParameter, name, file, line, column,
                          ParameterAttributes{options.index, options.is_rest,
                                              options.has_default});
}

NodeRecord NodeFactory::CreateParameterWithContext(const std::string &name,
                                                   const ScopeContext &context,
                                                   int line, int column,
                                                   ParameterOptions options,
                                                   int discriminator) {
  return CreateContextual(NodeType::kParameter, name, context, line, column,
                          discriminator,
                          ParameterAttributes{options.index, options.is_rest,
                                              options.has_default});
}

NodeRecord NodeFactory::CreateTryBlock(const std::string &file, int line,
                                       int column) {
  return CreatePositional(NodeType::kTryBlock, kTryBlockName, file, line,
                          column, BlockAttributes{});
}

NodeRecord NodeFactory::CreateTryBlockWithContext(const ScopeContext &context,
                                                  int line, int column,
                                                  int discriminator) {
  return CreateContextual(NodeType::kTryBlock, kTryBlockName, context, line,
                          column, discriminator, BlockAttributes{});
}

NodeRecord NodeFactory::CreateCatchBlock(const std::string &file, int line,
                                         int column,
                                         CatchBlockOptions options) {
  return CreatePositional(
      NodeType::kCatchBlock, kCatchBlockName, file, line, column,
      BlockAttributes{std::move(options.parameter_name),
                      std::move(options.parent_try_block_id)});
}

NodeRecord NodeFactory::CreateCatchBlockWithContext(
    const ScopeContext &context, int line, int column,
    CatchBlockOptions options, int discriminator) {
  return CreateContextual(
      NodeType::kCatchBlock, kCatchBlockName, context, line, column,
      discriminator,
      BlockAttributes{std::move(options.parameter_name),
                      std::move(options.parent_try_block_id)});
}

NodeRecord
NodeFactory::CreateFinallyBlock(const std::string &file, int line, int column,
                                const std::string &parent_try_block_id) {
  return CreatePositional(NodeType::kFinallyBlock, kFinallyBlockName, file,
                          line, column,
                          BlockAttributes{"", parent_try_block_id});
}

NodeRecord NodeFactory::CreateFinallyBlockWithContext(
    const ScopeContext &context, int line, int column,
    const std::string &parent_try_block_id, int discriminator) {
  return CreateContextual(NodeType::kFinallyBlock, kFinallyBlockName, context,
                          line, column, discriminator,
                          BlockAttributes{"", parent_try_block_id});
}

NodeRecord NodeFactory::CreateImport(const std::string &local,
                                     const std::string &file, int line,
                                     int column, ImportOptions options) {
  return CreatePositional(NodeType::kImport, local, file, line, column,
                          ToAttributes(local, std::move(options)));
}

NodeRecord NodeFactory::CreateImportWithContext(const std::string &local,
                                                const ScopeContext &context,
                                                int line, int column,
                                                ImportOptions options,
                                                int discriminator) {
  return CreateContextual(NodeType::kImport, local, context, line, column,
                          discriminator,
                          ToAttributes(local, std::move(options)));
}

NodeRecord NodeFactory::CreateExport(const std::string &exported,
                                     const std::string &file, int line,
                                     int column, ExportOptions options) {
  return CreatePositional(NodeType::kExport, exported, file, line, column,
                          ToAttributes(exported, std::move(options)));
}

NodeRecord NodeFactory::CreateExportWithContext(const std::string &exported,
                                                const ScopeContext &context,
                                                int line, int column,
                                                ExportOptions options,
                                                int discriminator) {
  return CreateContextual(NodeType::kExport, exported, context, line, column,
                          discriminator,
                          ToAttributes(exported, std::move(options)));
}

std::string NodeFactory::ModuleId(const std::string &file) {
  return ContextId(NodeType::kModule, kModuleName, ScopeContext{file, {}}, 0);
}

std::string NodeFactory::ClassReferenceId(const std::string &name,
                                          const ScopeContext &context) {
  Validate(NodeType::kClass, name, context.file, kUnknownPosition);
  return ContextId(NodeType::kClass, name, context, 0);
}

std::string NodeFactory::FunctionReferenceId(const std::string &name,
                                             const ScopeContext &context) {
  Validate(NodeType::kFunction, name, context.file, kUnknownPosition);
  return ContextId(NodeType::kFunction, name, context, 0);
}

} // namespace jsgraph
