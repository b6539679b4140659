#include <jsgraph/imported_call_resolver.h>
#include <jsgraph/in_memory_graph_backend.h>

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/project_graph.h"

namespace jsgraph {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::SizeIs;
using test::BuildProjectGraph;
using test::EdgesBetween;
using test::EdgesOfType;

TEST(ImportedCallResolverTest, LinksNamedImportsAndCalls) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph,
                    {{"src/api.js", "import { load as fetchUser } from './repo';\n"
                                    "async function handle() {\n"
                                    "  return await fetchUser(1);\n"
                                    "}\n"},
                     {"src/repo.js", "export async function load(id) {}\n"}});

  const auto result = ImportedCallResolver().Enrich(graph);

  EXPECT_EQ("imported-calls", result.enricher);
  EXPECT_EQ(1u, result.iterations);
  EXPECT_TRUE(result.converged);
  EXPECT_EQ(2u, result.edges_created);
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kImportsFrom,
                             "src/api.js->global->IMPORT->fetchUser",
                             "src/repo.js->global->EXPORT->load")
                    .size());
  const auto calls = EdgesBetween(graph, EdgeType::kCalls,
                                  "src/api.js->handle->CALL->fetchUser",
                                  "src/repo.js->global->FUNCTION->load");
  ASSERT_EQ(1u, calls.size());
  EXPECT_THAT(calls[0].metadata, Contains(Pair("resolvedVia", "import")));
}

TEST(ImportedCallResolverTest, ResolvesDefaultAndNamespaceImports) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph,
                    {{"src/app.js", "import save from './store';\n"
                                    "import * as utils from './utils';\n"
                                    "save();\n"
                                    "utils.format();\n"
                                    "utils.missing();\n"},
                     {"src/store.js", "export default function save() {}\n"},
                     {"src/utils/index.js", "export function format() {}\n"}});

  ImportedCallResolver().Enrich(graph);

  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kCalls,
                             "src/app.js->global->CALL->save",
                             "src/store.js->global->FUNCTION->save")
                    .size());
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kCalls,
                             "src/app.js->global->CALL->utils.format",
                             "src/utils/index.js->global->FUNCTION->format")
                    .size());
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kImportsFrom,
                             "src/app.js->global->IMPORT->save",
                             "src/store.js->global->EXPORT->default")
                    .size());
  EXPECT_EQ(2u, EdgesOfType(graph, EdgeType::kCalls).size());
}

TEST(ImportedCallResolverTest, FollowsReExports) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph,
                    {{"src/app.js", "import { run, stop } from './lib';\n"
                                    "run();\n"
                                    "stop();\n"},
                     {"src/lib/index.js", "export { run } from './run';\n"
                                          "export * from './stop';\n"},
                     {"src/lib/run.js", "export function run() {}\n"},
                     {"src/lib/stop.js", "function stop() {}\n"
                                         "export { stop };\n"}});

  ImportedCallResolver().Enrich(graph);

  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kCalls,
                             "src/app.js->global->CALL->run",
                             "src/lib/run.js->global->FUNCTION->run")
                    .size());
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kCalls,
                             "src/app.js->global->CALL->stop",
                             "src/lib/stop.js->global->FUNCTION->stop")
                    .size());
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kImportsFrom,
                             "src/app.js->global->IMPORT->stop",
                             "src/lib/stop.js->global->EXPORT->stop")
                    .size());
}

TEST(ImportedCallResolverTest, IgnoresPackagesAndUnknownNames) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph,
                    {{"src/app.js", "import express from 'express';\n"
                                    "import { nope } from './lib';\n"
                                    "express();\n"
                                    "nope();\n"},
                     {"src/lib.js", "export const value = 1;\n"}});

  const auto result = ImportedCallResolver().Enrich(graph);

  EXPECT_EQ(0u, result.edges_created);
  EXPECT_THAT(EdgesOfType(graph, EdgeType::kImportsFrom), IsEmpty());
  EXPECT_THAT(EdgesOfType(graph, EdgeType::kCalls), IsEmpty());
}

TEST(ImportedCallResolverTest, SurvivesCircularReExports) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph, {{"src/a.js", "export * from './b';\n"
                                         "import { ghost } from './b';\n"
                                         "ghost();\n"},
                            {"src/b.js", "export * from './a';\n"}});

  const auto result = ImportedCallResolver().Enrich(graph);

  EXPECT_EQ(0u, result.edges_created);
}

TEST(ImportedCallResolverTest, LeavesSameFileCallsAlone) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph, {{"src/app.js", "import { helper } from './lib';\n"
                                           "function local() {}\n"
                                           "local();\n"},
                            {"src/lib.js", "export function helper() {}\n"}});

  const auto result = ImportedCallResolver().Enrich(graph);

  EXPECT_EQ(1u, result.edges_created);
  EXPECT_EQ(1u, EdgesOfType(graph, EdgeType::kCalls).size());
}

TEST(ImportedCallResolverTest, LinksRejectionsToImportedClasses) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(
      graph,
      {{"src/c.js", "import VE from './e';\n"
                    "import * as errs from './more';\n"
                    "export async function a() { throw new VE('x'); }\n"
                    "export async function b() { throw new errs.Gone(); }\n"},
       {"src/e.js", "export default class ValidationError extends Error {}\n"},
       {"src/more.js", "export class Gone extends Error {}\n"}});

  ImportedCallResolver().Enrich(graph);

  const auto rejects =
      EdgesBetween(graph, EdgeType::kRejects, "src/c.js->global->FUNCTION->a",
                   "src/e.js->global->CLASS->ValidationError");
  ASSERT_EQ(1u, rejects.size());
  EXPECT_THAT(rejects[0].metadata, Contains(Pair("resolvedVia", "import")));
  EXPECT_THAT(rejects[0].metadata, Contains(Pair("line", "3")));
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kRejects,
                             "src/c.js->global->FUNCTION->b",
                             "src/more.js->global->CLASS->Gone")
                    .size());
  EXPECT_THAT(EdgesOfType(graph, EdgeType::kRejects), SizeIs(2u));
}

TEST(ImportedCallResolverTest, FollowsExportAliasesToClassDeclarations) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph,
                    {{"src/app.js", "import { Bar } from './errors';\n"
                                    "class Local extends Bar {}\n"
                                    "function check() { throw new Bar(); }\n"
                                    "function make() {\n"
                                    "  const failure = new Bar();\n"
                                    "  return failure;\n"
                                    "}\n"},
                     {"src/errors.js", "class Foo extends Error {}\n"
                                       "export { Foo as Bar };\n"}});

  ImportedCallResolver().Enrich(graph);

  const std::string foo = "src/errors.js->global->CLASS->Foo";
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kDerivesFrom,
                             "src/app.js->global->CLASS->Local", foo)
                    .size());
  EXPECT_EQ(1u, EdgesBetween(graph, EdgeType::kThrows,
                             "src/app.js->global->FUNCTION->check", foo)
                    .size());
  const auto instances = EdgesOfType(graph, EdgeType::kInstanceOf);
  ASSERT_EQ(1u, instances.size());
  EXPECT_EQ(foo, instances[0].dst);
  const auto variable = graph.GetNode(instances[0].src);
  ASSERT_TRUE(variable.has_value());
  EXPECT_EQ("failure", variable->name);
}

TEST(ImportedCallResolverTest, RecordsClassesFromPackagesAsBuiltins) {
  InMemoryGraphBackend graph;
  BuildProjectGraph(graph,
                    {{"src/app.js", "import { HttpError } from 'http-errors';\n"
                                    "async function f() { throw new HttpError(); }\n"}});
  ImportedCallResolver resolver;

  resolver.Enrich(graph);
  const auto second = resolver.Enrich(graph);

  EXPECT_EQ(0u, second.edges_created);
  EXPECT_THAT(EdgesOfType(graph, EdgeType::kRejects), IsEmpty());
  const auto f = graph.GetNode("src/app.js->global->FUNCTION->f");
  ASSERT_TRUE(f.has_value());
  EXPECT_THAT(f->AsFunction()->control_flow.rejected_builtin_errors,
              ElementsAre("HttpError"));
}

} // namespace
} // namespace jsgraph
