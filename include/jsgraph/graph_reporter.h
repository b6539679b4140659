#pragma once

#include <jsgraph/interfaces.h>

#include <string>

namespace jsgraph {

// Markdown and JSON summaries of an analysis, plus the full graph as JSON
// when the `graph` format is requested.
class GraphReporter : public Reporter {
public:
  Report Render(const AnalysisResult &result, const GraphBackend &graph,
                const AnalysisConfig &config) override;
};

std::string EscapeJsonString(const std::string &value);
std::string RenderGraphJson(const GraphBackend &graph);

} // namespace jsgraph
