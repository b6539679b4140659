#pragma once

#include <jsgraph/js_ast.h>

#include <string>
#include <string_view>

namespace jsgraph {

// Grammar a source file is parsed with.
enum class SourceDialect { kJavaScript, kTypeScript, kTsx };

// `.ts`, `.mts` and `.cts` are TypeScript, `.tsx` is TypeScript with JSX and
// everything else is JavaScript (JSX included).
SourceDialect DialectForFile(const std::string &file);

// Parses one module with tree-sitter and lowers the syntax tree into the
// ast:: model. Type-level TypeScript syntax produces no AST. Throws
// ParseError at the first syntax error of the tree.
ast::Program ParseModule(std::string_view source, const std::string &file);

ast::Program ParseModule(std::string_view source, const std::string &file,
                         SourceDialect dialect);

} // namespace jsgraph
