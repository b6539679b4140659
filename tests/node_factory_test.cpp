#include <jsgraph/errors.h>
#include <jsgraph/node_factory.h>

#include <gtest/gtest.h>

namespace jsgraph {
namespace {

TEST(NodeFactoryTest, PositionalIdsAreDeterministic) {
  const auto first = NodeFactory::CreateFunction("load", "src/a.js", 3, 5);
  const auto second = NodeFactory::CreateFunction("load", "src/a.js", 3, 5);

  EXPECT_EQ(first.id, second.id);
  EXPECT_EQ("FUNCTION#load#src/a.js#3:5", first.id);
  EXPECT_EQ(NodeType::kFunction, first.type);
  EXPECT_EQ("load", first.name);
  EXPECT_EQ("src/a.js", first.file);
}

TEST(NodeFactoryTest, ContextIdsUseScopePathOrGlobal) {
  const ScopeContext global{"src/a.js", {}};
  const ScopeContext nested{"src/a.js", {"Service", "load"}};

  EXPECT_EQ("src/a.js->global->CALL->fetch",
            NodeFactory::CreateCallWithContext("fetch", global, 10, 3).id);
  EXPECT_EQ("src/a.js->Service->load->CALL->fetch",
            NodeFactory::CreateCallWithContext("fetch", nested, 10, 3).id);
}

TEST(NodeFactoryTest, ContextIdsSurviveLineChanges) {
  const ScopeContext context{"src/a.js", {"handler"}};
  const auto before =
      NodeFactory::CreateVariableWithContext("user", context, 4, 9);
  const auto after =
      NodeFactory::CreateVariableWithContext("user", context, 40, 1);

  EXPECT_EQ(before.id, after.id);
  EXPECT_NE(before.line, after.line);
}

TEST(NodeFactoryTest, DiscriminatorSeparatesRepeatedNames) {
  const ScopeContext context{"src/a.js", {}};
  EXPECT_EQ("src/a.js->global->CALL->log",
            NodeFactory::CreateCallWithContext("log", context, 1, 1, {}, 0).id);
  EXPECT_EQ("src/a.js->global->CALL->log#2",
            NodeFactory::CreateCallWithContext("log", context, 3, 1, {}, 2).id);
  EXPECT_THROW(
      NodeFactory::CreateCallWithContext("log", context, 3, 1, {}, -1),
      ValidationError);
}

TEST(NodeFactoryTest, MissingRequiredFieldsAreRejected) {
  EXPECT_THROW(NodeFactory::CreateFunction("", "src/a.js", 1, 1),
               ValidationError);
  EXPECT_THROW(NodeFactory::CreateFunction("load", "", 1, 1),
               ValidationError);
  EXPECT_THROW(NodeFactory::CreateFunction("load", "src/a.js", -1, 1),
               ValidationError);
  EXPECT_THROW(NodeFactory::CreateClassWithContext("", {"src/a.js", {}}, 1, 1),
               ValidationError);
  EXPECT_THROW(NodeFactory::CreateModule(""), ValidationError);
}

TEST(NodeFactoryTest, ModuleIdMatchesCreatedModule) {
  const auto module = NodeFactory::CreateModule("lib/index.ts");
  EXPECT_EQ("lib/index.ts->global->MODULE->module", module.id);
  EXPECT_EQ(module.id, NodeFactory::ModuleId("lib/index.ts"));
}

TEST(NodeFactoryTest, ReferenceIdsMatchDeclarations) {
  const ScopeContext context{"src/errors.js", {}};
  EXPECT_EQ(
      NodeFactory::CreateClassWithContext("ValidationError", context, 2, 1).id,
      NodeFactory::ClassReferenceId("ValidationError", context));
  EXPECT_EQ(NodeFactory::CreateFunctionWithContext("load", context, 9, 1).id,
            NodeFactory::FunctionReferenceId("load", context));
}

TEST(NodeFactoryTest, CopiesTypedAttributes) {
  FunctionOptions options;
  options.is_async = true;
  options.parameters = {"id", "options"};
  const auto function = NodeFactory::CreateFunctionWithContext(
      "load", {"src/a.js", {}}, 1, 1, options);
  ASSERT_NE(nullptr, function.AsFunction());
  EXPECT_TRUE(function.AsFunction()->is_async);
  EXPECT_EQ(2u, function.AsFunction()->parameters.size());
  EXPECT_EQ(1, function.AsFunction()->control_flow.cyclomatic_complexity);

  CallOptions call_options;
  call_options.object = "api";
  call_options.method = "get";
  const auto call = NodeFactory::CreateCallWithContext(
      "api.get", {"src/a.js", {}}, 2, 1, call_options);
  ASSERT_NE(nullptr, call.AsCall());
  EXPECT_TRUE(call.AsCall()->is_method_call);

  const auto import = NodeFactory::CreateImportWithContext(
      "load", {"src/a.js", {}}, 1, 1, ImportOptions{"./loader", ""});
  ASSERT_NE(nullptr, import.AsImport());
  EXPECT_EQ("load", import.AsImport()->imported);

  const auto exported = NodeFactory::CreateExportWithContext(
      "default", {"src/a.js", {}}, 1, 1, ExportOptions{"App", "", false});
  ASSERT_NE(nullptr, exported.AsExport());
  EXPECT_TRUE(exported.AsExport()->is_default);
}

TEST(NodeFactoryTest, FinallyBlocksRememberTheirTry) {
  const auto block = NodeFactory::CreateFinallyBlockWithContext(
      {"src/a.js", {"load"}}, 7, 5, "src/a.js->load->TRY_BLOCK->try");
  ASSERT_NE(nullptr, block.AsBlock());
  EXPECT_EQ("src/a.js->load->TRY_BLOCK->try",
            block.AsBlock()->parent_try_block_id);
  EXPECT_EQ("src/a.js->load->FINALLY_BLOCK->finally", block.id);
}

} // namespace
} // namespace jsgraph
