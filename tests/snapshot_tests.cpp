#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <string>
#include "io/Snapshot.h"

namespace {
std::size_t countOf(const std::string& text, char c) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), c));
}
}

TEST(SnapshotTest, WorldJsonCarriesAgentsAndEnvironment) {
    Kernel kernel;
    kernel.step();
    const std::string json = kernelToJson(kernel, true);

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_EQ(countOf(json, '{'), countOf(json, '}'));
    EXPECT_EQ(countOf(json, '['), countOf(json, ']'));
    EXPECT_NE(json.find("\"tick\":1"), std::string::npos);
    EXPECT_NE(json.find("\"season\":\"spring\""), std::string::npos);
    EXPECT_NE(json.find("\"id\":\"player\""), std::string::npos);
    EXPECT_NE(json.find("\"kind\":\"causal\""), std::string::npos);
    EXPECT_NE(json.find("\"resources\":["), std::string::npos);

    const std::string compact = kernelToJson(kernel);
    EXPECT_EQ(compact.find("\"resources\":["), std::string::npos);
    EXPECT_NE(compact.find("\"resourceCount\":"), std::string::npos);
}

TEST(SnapshotTest, StringsAreEscaped) {
    WorldView view;
    AgentView a;
    a.id = "odd\"id\\";
    view.agents.push_back(a);
    const std::string json = worldToJson(view);
    EXPECT_NE(json.find("\"id\":\"odd\\\"id\\\\\""), std::string::npos);
}

TEST(SnapshotTest, ReasoningTraceIsExported) {
    KernelConfig cfg;
    cfg.reasoningFrequency = 1.0;
    Kernel kernel(cfg);
    kernel.step();

    const std::string json = kernelToJson(kernel);
    EXPECT_NE(json.find("\"lastReasoning\":{"), std::string::npos);
    EXPECT_NE(json.find("\"type\":\"conclusion\""), std::string::npos);

    const auto info = kernel.inspectAgent("causal_0");
    ASSERT_TRUE(info.has_value());
    const std::string detail = inspectionToJson(*info);
    EXPECT_NE(detail.find("\"personality\":"), std::string::npos);
    EXPECT_NE(detail.find("\"decisionCount\":1"), std::string::npos);
    EXPECT_NE(detail.find("\"reasoningHistory\":[{"), std::string::npos);
    EXPECT_NE(detail.find("\"social\":{"), std::string::npos);
    EXPECT_NE(info->reasoningPrompt.find("CURRENT SITUATION:"), std::string::npos);
    EXPECT_NE(detail.find("\"reasoningPrompt\":\"You are a "), std::string::npos);
    EXPECT_EQ(countOf(detail, '{'), countOf(detail, '}'));
}

TEST(SnapshotTest, InspectionOfLearnerAndPlayer) {
    Kernel kernel;
    kernel.setPlayerTarget(3.0, 4.0);

    const std::string learner = inspectionToJson(*kernel.inspectAgent("rl_9"));
    EXPECT_EQ(learner.find("\"social\""), std::string::npos);
    EXPECT_EQ(learner.find("\"personality\""), std::string::npos);
    EXPECT_EQ(learner.find("\"reasoningPrompt\""), std::string::npos);

    const std::string player = inspectionToJson(*kernel.inspectAgent("player"));
    EXPECT_NE(player.find("\"kind\":\"player\""), std::string::npos);
    EXPECT_NE(player.find("\"target\":[3.0000,4.0000]"), std::string::npos);
}

TEST(SnapshotTest, MetricsRowMatchesHeader) {
    Kernel kernel;
    kernel.stepN(5);

    std::ostringstream header;
    writeMetricsHeader(header);
    std::ostringstream row;
    logMetrics(kernel, row);

    EXPECT_EQ(countOf(header.str(), ','), 15u);
    EXPECT_EQ(countOf(row.str(), ','), 15u);
    EXPECT_EQ(row.str().rfind("5,25,", 0), 0u);
    EXPECT_EQ(row.str().back(), '\n');
}

TEST(SnapshotTest, HistoryCsv) {
    Kernel kernel;
    kernel.stepN(20);
    std::ostringstream out;
    logHistory(kernel, out);

    std::istringstream in(out.str());
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "tick,total,susceptible,infected,recovered");
    std::getline(in, line);
    EXPECT_EQ(line.rfind("10,", 0), 0u);
    std::getline(in, line);
    EXPECT_EQ(line.rfind("20,", 0), 0u);
}
