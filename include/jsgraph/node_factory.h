#pragma once

#include <jsgraph/graph.h>

#include <string>
#include <vector>

namespace jsgraph {

// Position used when the parser could not supply one.
constexpr int kUnknownPosition = 0;

struct ScopeContext {
  std::string file;
  std::vector<std::string> scope_path;
};

struct FunctionOptions {
  bool is_async = false;
  bool is_generator = false;
  bool is_arrow = false;
  bool is_method = false;
  std::string class_name;
  std::vector<std::string> parameters;
};

struct ClassOptions {
  std::string super_class;
};

struct CallOptions {
  std::string object;
  std::string method;
  bool is_awaited = false;
  bool is_inside_try = false;
  int argument_count = 0;
};

struct ConstructorCallOptions {
  int argument_count = 0;
};

struct LiteralOptions {
  int entry_count = 0;
};

struct VariableOptions {
  std::string kind = "let";
};

struct ParameterOptions {
  int index = 0;
  bool is_rest = false;
  bool has_default = false;
};

struct CatchBlockOptions {
  std::string parameter_name;
  std::string parent_try_block_id;
};

struct ImportOptions {
  std::string source;
  std::string imported;
};

struct ExportOptions {
  std::string local;
  std::string source;
  bool is_default = false;
};

// The only place graph node IDs are composed. Create* builds the positional
// form `{TYPE}#{name}#{file}#{line}:{column}`; Create*WithContext builds the
// lexical form `{file}->{scope|global}->{TYPE}->{name}[#n]`, which survives
// line churn. Every factory throws ValidationError when name, file or line is
// missing.
class NodeFactory {
public:
  static NodeRecord CreateModule(const std::string &file);

  static NodeRecord CreateFunction(const std::string &name,
                                   const std::string &file, int line,
                                   int column, FunctionOptions options = {});
  static NodeRecord
  CreateFunctionWithContext(const std::string &name,
                            const ScopeContext &context, int line, int column,
                            FunctionOptions options = {},
                            int discriminator = 0);

  static NodeRecord CreateClass(const std::string &name,
                                const std::string &file, int line, int column,
                                ClassOptions options = {});
  static NodeRecord CreateClassWithContext(const std::string &name,
                                           const ScopeContext &context,
                                           int line, int column,
                                           ClassOptions options = {},
                                           int discriminator = 0);

  static NodeRecord CreateCall(const std::string &name,
                               const std::string &file, int line, int column,
                               CallOptions options = {});
  static NodeRecord CreateCallWithContext(const std::string &name,
                                          const ScopeContext &context,
                                          int line, int column,
                                          CallOptions options = {},
                                          int discriminator = 0);

  static NodeRecord CreateConstructorCall(const std::string &class_name,
                                          const std::string &file, int line,
                                          int column,
                                          ConstructorCallOptions options = {});
  static NodeRecord CreateConstructorCallWithContext(
      const std::string &class_name, const ScopeContext &context, int line,
      int column, ConstructorCallOptions options = {}, int discriminator = 0);

  static NodeRecord CreateObjectLiteral(const std::string &file, int line,
                                        int column,
                                        LiteralOptions options = {});
  static NodeRecord CreateObjectLiteralWithContext(const ScopeContext &context,
                                                   int line, int column,
                                                   LiteralOptions options = {},
                                                   int discriminator = 0);

  static NodeRecord CreateArrayLiteral(const std::string &file, int line,
                                       int column, LiteralOptions options = {});
  static NodeRecord CreateArrayLiteralWithContext(const ScopeContext &context,
                                                  int line, int column,
                                                  LiteralOptions options = {},
                                                  int discriminator = 0);

  static NodeRecord CreateVariable(const std::string &name,
                                   const std::string &file, int line,
                                   int column, VariableOptions options = {});
  static NodeRecord CreateVariableWithContext(const std::string &name,
                                              const ScopeContext &context,
                                              int line, int column,
                                              VariableOptions options = {},
                                              int discriminator = 0);

  static NodeRecord CreateParameter(const std::string &name,
                                    const std::string &file, int line,
                                    int column, ParameterOptions options = {});
  static NodeRecord CreateParameterWithContext(const std::string &name,
                                               const ScopeContext &context,
                                               int line, int column,
                                               ParameterOptions options = {},
                                               int discriminator = 0);

  static NodeRecord CreateTryBlock(const std::string &file, int line,
                                   int column);
  static NodeRecord CreateTryBlockWithContext(const ScopeContext &context,
                                              int line, int column,
                                              int discriminator = 0);

  static NodeRecord CreateCatchBlock(const std::string &file, int line,
                                     int column,
                                     CatchBlockOptions options = {});
  static NodeRecord CreateCatchBlockWithContext(const ScopeContext &context,
                                                int line, int column,
                                                CatchBlockOptions options = {},
                                                int discriminator = 0);

  static NodeRecord CreateFinallyBlock(const std::string &file, int line,
                                       int column,
                                       const std::string &parent_try_block_id);
  static NodeRecord
  CreateFinallyBlockWithContext(const ScopeContext &context, int line,
                                int column,
                                const std::string &parent_try_block_id,
                                int discriminator = 0);

  static NodeRecord CreateImport(const std::string &local,
                                 const std::string &file, int line, int column,
                                 ImportOptions options = {});
  static NodeRecord CreateImportWithContext(const std::string &local,
                                            const ScopeContext &context,
                                            int line, int column,
                                            ImportOptions options = {},
                                            int discriminator = 0);

  static NodeRecord CreateExport(const std::string &exported,
                                 const std::string &file, int line, int column,
                                 ExportOptions options = {});
  static NodeRecord CreateExportWithContext(const std::string &exported,
                                            const ScopeContext &context,
                                            int line, int column,
                                            ExportOptions options = {},
                                            int discriminator = 0);

  // IDs of nodes that may be declared elsewhere. They match what the
  // corresponding Create*WithContext call yields for the same name and scope.
  static std::string ModuleId(const std::string &file);
  static std::string ClassReferenceId(const std::string &name,
                                      const ScopeContext &context);
  static std::string FunctionReferenceId(const std::string &name,
                                         const ScopeContext &context);
};

} // namespace jsgraph
