#include <jsgraph/enricher_registry.h>
#include <jsgraph/in_memory_graph_backend.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/project_graph.h"

namespace jsgraph {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

class CountingEnricher : public Enricher {
public:
  std::string Name() const override { return "counting"; }
  EnrichmentResult Enrich(GraphBackend &graph) override {
    EnrichmentResult result;
    result.enricher = Name();
    result.iterations = 1;
    result.edges_created = graph.CountEdgesByType().size();
    return result;
  }
};

EnricherRegistry::EnricherFactory CountingFactory() {
  return [](const EnricherOptions &) {
    return std::make_unique<CountingEnricher>();
  };
}

TEST(EnricherRegistryTest, DefaultsRunInRegistrationOrder) {
  const auto registry = MakeEnricherRegistryWithDefaults();

  EXPECT_THAT(registry.DefaultEnricherNames(),
              ElementsAre("imported-calls", "rejection-propagation"));
  const auto enrichers = registry.CreateEnrichers({}, EnricherOptions{});
  ASSERT_EQ(2u, enrichers.size());
  EXPECT_EQ("imported-calls", enrichers[0]->Name());
  EXPECT_EQ("rejection-propagation", enrichers[1]->Name());
}

TEST(EnricherRegistryTest, CreatesExplicitSelectionInGivenOrder) {
  const auto &registry = GlobalEnricherRegistry();

  const auto enrichers = registry.CreateEnrichers(
      {"rejection-propagation", "imported-calls"}, EnricherOptions{});

  ASSERT_EQ(2u, enrichers.size());
  EXPECT_EQ("rejection-propagation", enrichers[0]->Name());
  EXPECT_EQ("imported-calls", enrichers[1]->Name());
}

TEST(EnricherRegistryTest, UnknownNamesListRegisteredEnrichers) {
  const auto registry = MakeEnricherRegistryWithDefaults();

  try {
    registry.CreateEnricher("taint", EnricherOptions{});
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("Unknown enricher 'taint'"));
    EXPECT_THAT(error.what(),
                HasSubstr("imported-calls, rejection-propagation"));
  }
}

TEST(EnricherRegistryTest, RejectsInvalidRegistrations) {
  EnricherRegistry registry;
  registry.RegisterEnricher("counting", CountingFactory());

  EXPECT_THROW(registry.RegisterEnricher("counting", CountingFactory()),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterEnricher("", CountingFactory()),
               std::invalid_argument);
  EXPECT_THROW(registry.RegisterEnricher("empty", nullptr),
               std::invalid_argument);
}

TEST(EnricherRegistryTest, OptionalEnrichersRunOnlyWhenSelected) {
  EnricherRegistry registry;
  registry.RegisterEnricher("counting", CountingFactory(), false);
  registry.RegisterEnricher(
      "null", [](const EnricherOptions &) { return nullptr; }, false);

  EXPECT_TRUE(registry.DefaultEnricherNames().empty());
  EXPECT_TRUE(registry.CreateEnrichers({}, EnricherOptions{}).empty());
  EXPECT_THAT(registry.EnricherNames(), ElementsAre("counting", "null"));
  EXPECT_EQ("counting",
            registry.CreateEnricher("counting", EnricherOptions{})->Name());
  EXPECT_THROW(registry.CreateEnricher("null", EnricherOptions{}),
               std::runtime_error);
}

TEST(EnricherRegistryTest, PassesOptionsToFactories) {
  InMemoryGraphBackend graph;
  test::BuildProjectGraph(graph,
                          {{"app.js", "class E extends Error {}\n"
                                      "async function c() { throw new E(); }\n"
                                      "async function b() { await c(); }\n"
                                      "async function a() { await b(); }\n"}});
  EnricherOptions options;
  options.max_iterations = 1;

  auto enricher =
      GlobalEnricherRegistry().CreateEnricher("rejection-propagation", options);
  const auto result = enricher->Enrich(graph);

  EXPECT_EQ(1u, result.iterations);
  EXPECT_FALSE(result.converged);
}

} // namespace
} // namespace jsgraph
