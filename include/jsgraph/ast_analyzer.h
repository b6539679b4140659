#pragma once

#include <jsgraph/interfaces.h>
#include <jsgraph/js_ast.h>
#include <jsgraph/micro_trace.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace jsgraph {

struct AstAnalyzerOptions {
  std::size_t max_trace_hops = kDefaultMaxTraceHops;
};

// Single forward pass over one module. Nodes are created through
// NodeFactory with lexical IDs; relations that need other nodes to exist
// (calls, inheritance, rejections) are recorded in the collections and left
// to GraphBuilder.
class AstAnalyzer : public FileAnalyzer {
public:
  explicit AstAnalyzer(AstAnalyzerOptions options = {});

  FileCollections Analyze(const SourceFile &file) const override;
  FileCollections AnalyzeSource(std::string_view source,
                                const std::string &file) const;
  FileCollections AnalyzeProgram(const ast::Program &program) const;

private:
  AstAnalyzerOptions options_;
};

} // namespace jsgraph
