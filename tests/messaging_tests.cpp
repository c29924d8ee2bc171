#include <gtest/gtest.h>
#include "modules/Messaging.h"
#include "modules/SocialMemory.h"
#include "utils/IdGenerator.h"
#include "ScriptedRandom.h"

namespace {
CommunicationContext makeContext(double energy, int infected, double resource,
                                 Personality personality = Personality::Social) {
    CommunicationContext ctx;
    ctx.self = "causal_1";
    ctx.position = {4.0, 1.0, -2.0};
    ctx.observation.energy = energy;
    ctx.observation.nearbyInfected = infected;
    ctx.observation.nearbyCount = infected;
    ctx.observation.nearestResourceDistance = resource;
    ctx.personality = personality;
    ctx.age = 50;
    ctx.tick = 7;
    return ctx;
}

Message makeMessage(const std::string& sender, MessageType type, std::optional<PlanarPoint> location,
                    const std::string& urgency = "normal") {
    Message m;
    m.id = "msg_test";
    m.sender = sender;
    m.type = type;
    m.content.location = location;
    m.content.urgency = urgency;
    m.content.text = "test";
    return m;
}
}

TEST(MessagingTest, ThreatWarningWinsWaterfall) {
    SocialKnowledge knowledge;
    ScriptedRandom rng;
    IdGenerator ids;
    auto out = composeMessage(makeContext(60, 3, 1.0), knowledge, rng, ids);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->message.type, MessageType::ThreatWarning);
    EXPECT_EQ(out->message.priority, MessagePriority::High);
    EXPECT_EQ(out->cooldown, 15);
    EXPECT_EQ(out->message.content.urgency, "high");
    ASSERT_TRUE(out->message.content.location.has_value());
    EXPECT_DOUBLE_EQ(out->message.content.location->x, 4.0);
    EXPECT_DOUBLE_EQ(out->message.content.location->z, -2.0);
    EXPECT_EQ(out->message.sender, "causal_1");
    EXPECT_EQ(out->message.timestamp, 7u);
    EXPECT_EQ(rng.consumed(), 0u);
}

TEST(MessagingTest, ResourceLocationWhenFedAndNearFood) {
    SocialKnowledge knowledge;
    ScriptedRandom rng;
    IdGenerator ids;
    // two infected is below the warning threshold
    auto out = composeMessage(makeContext(60, 2, 2.0), knowledge, rng, ids);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->message.type, MessageType::ResourceLocation);
    EXPECT_EQ(out->message.priority, MessagePriority::Normal);
    EXPECT_EQ(out->cooldown, 20);
    EXPECT_EQ(out->message.id, "msg_0");
}

TEST(MessagingTest, ResourceLocationOutranksKnowledgeShare) {
    SocialKnowledge knowledge;
    ResourceTip tip;
    tip.location = {3.0, 3.0};
    tip.source = "causal_2";
    knowledge.resourceTips.push_back(tip);
    // a draw of 0.0 would pass the knowledge-share roll
    ScriptedRandom rng({0.0});
    IdGenerator ids;
    auto out = composeMessage(makeContext(60, 0, 2.0), knowledge, rng, ids);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->message.type, MessageType::ResourceLocation);
    EXPECT_EQ(out->cooldown, 20);
    EXPECT_EQ(rng.consumed(), 0u);
}

TEST(MessagingTest, InfectedSelfDoesNotWarn) {
    SocialKnowledge knowledge;
    ScriptedRandom rng;
    IdGenerator ids;
    CommunicationContext ctx = makeContext(60, 4, 2.0);
    ctx.observation.status = HealthStatus::Infected;
    auto out = composeMessage(ctx, knowledge, rng, ids);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->message.type, MessageType::ResourceLocation);
}

TEST(MessagingTest, HelpRequestUnlessSolitary) {
    SocialKnowledge knowledge;
    IdGenerator ids;
    ScriptedRandom rng({}, 0.5);
    auto out = composeMessage(makeContext(10, 0, 50.0), knowledge, rng, ids);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->message.type, MessageType::HelpRequest);
    EXPECT_EQ(out->cooldown, 30);
    EXPECT_DOUBLE_EQ(out->message.content.detail, 10.0);

    auto none = composeMessage(makeContext(10, 0, 50.0, Personality::Solitary), knowledge, rng, ids);
    EXPECT_FALSE(none.has_value());
}

TEST(MessagingTest, KnowledgeShareCarriesNewestTip) {
    SocialKnowledge knowledge;
    ResourceTip older;
    older.location = {1.0, 1.0};
    older.receivedAt = 10;
    ResourceTip newer;
    newer.location = {-6.0, 3.0};
    newer.receivedAt = 40;
    knowledge.resourceTips.push_front(older);
    knowledge.resourceTips.push_front(newer);

    IdGenerator ids;
    ScriptedRandom rng({0.05});
    auto out = composeMessage(makeContext(45, 0, 50.0), knowledge, rng, ids);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->message.type, MessageType::KnowledgeShare);
    EXPECT_EQ(out->message.priority, MessagePriority::Low);
    EXPECT_EQ(out->cooldown, 25);
    ASSERT_TRUE(out->message.content.location.has_value());
    EXPECT_DOUBLE_EQ(out->message.content.location->x, -6.0);
    EXPECT_DOUBLE_EQ(out->message.content.location->z, 3.0);
    EXPECT_DOUBLE_EQ(out->message.content.detail, 10.0);

    ScriptedRandom miss({0.5});
    EXPECT_FALSE(composeMessage(makeContext(45, 0, 50.0), knowledge, miss, ids).has_value());
}

TEST(MessagingTest, ReceiveStoresTipAndRemembersSender) {
    SocialKnowledge knowledge;
    SocialMemory memory;
    receiveMessage(knowledge, memory, makeMessage("causal_2", MessageType::ResourceLocation, PlanarPoint{3, 4}),
                   25, 100);

    ASSERT_EQ(knowledge.resourceTips.size(), 1u);
    const ResourceTip& tip = knowledge.resourceTips.front();
    EXPECT_DOUBLE_EQ(tip.location.x, 3.0);
    EXPECT_DOUBLE_EQ(tip.confidence, 0.8);
    EXPECT_EQ(tip.receivedAt, 25);
    EXPECT_EQ(tip.source, "causal_2");
    EXPECT_FALSE(tip.checked);

    EXPECT_EQ(knowledge.pending.size(), 1u);
    EXPECT_EQ(memory.inbox().size(), 1u);
    const SocialRecord* record = memory.find("causal_2");
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->interactions, 1);
    EXPECT_EQ(record->firstSeen, 100u);
}

TEST(MessagingTest, DangerZoneAndHelpRequestRecords) {
    SocialKnowledge knowledge;
    SocialMemory memory;
    receiveMessage(knowledge, memory, makeMessage("a", MessageType::ThreatWarning, PlanarPoint{1, 1}, "high"), 5, 1);
    receiveMessage(knowledge, memory, makeMessage("b", MessageType::HelpRequest, std::nullopt, "high"), 5, 1);

    ASSERT_EQ(knowledge.dangerZones.size(), 1u);
    EXPECT_DOUBLE_EQ(knowledge.dangerZones.front().radius, 5.0);
    EXPECT_DOUBLE_EQ(knowledge.dangerZones.front().confidence, 0.7);
    ASSERT_EQ(knowledge.helpRequests.size(), 1u);
    EXPECT_EQ(knowledge.helpRequests.front().requester, "b");
    EXPECT_FALSE(knowledge.helpRequests.front().location.has_value());
}

TEST(MessagingTest, MissingLocationIsIgnoredForTipsAndZones) {
    SocialKnowledge knowledge;
    SocialMemory memory;
    receiveMessage(knowledge, memory, makeMessage("a", MessageType::ResourceLocation, std::nullopt), 5, 1);
    receiveMessage(knowledge, memory, makeMessage("a", MessageType::ThreatWarning, std::nullopt, "high"), 5, 1);
    EXPECT_TRUE(knowledge.resourceTips.empty());
    EXPECT_TRUE(knowledge.dangerZones.empty());
    EXPECT_EQ(memory.inbox().size(), 2u);
}

TEST(MessagingTest, RecordListsKeepTenNewestFirst) {
    SocialKnowledge knowledge;
    SocialMemory memory;
    for (int i = 0; i < 12; ++i) {
        receiveMessage(knowledge, memory,
                       makeMessage("s", MessageType::ResourceLocation, PlanarPoint{double(i), 0}), i, i);
    }
    ASSERT_EQ(knowledge.resourceTips.size(), 10u);
    EXPECT_DOUBLE_EQ(knowledge.resourceTips.front().location.x, 11.0);
    EXPECT_DOUBLE_EQ(knowledge.resourceTips.back().location.x, 2.0);
}

TEST(MessagingTest, InboxIsBounded) {
    SocialKnowledge knowledge;
    SocialMemory memory;
    for (int i = 0; i < 25; ++i) {
        Message m = makeMessage("s", MessageType::KnowledgeShare, std::nullopt);
        m.timestamp = static_cast<std::uint64_t>(i);
        receiveMessage(knowledge, memory, m, 0, i);
    }
    EXPECT_EQ(memory.inbox().size(), 20u);
    EXPECT_EQ(memory.inbox().front().timestamp, 5u);
    const auto recent = memory.recentMessages(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent.back().timestamp, 24u);
}

TEST(MessagingTest, PendingQueueProcessing) {
    SocialKnowledge knowledge;
    SocialMemory memory;
    receiveMessage(knowledge, memory, makeMessage("r", MessageType::ResourceLocation, PlanarPoint{2, 2}), 0, 1);
    receiveMessage(knowledge, memory, makeMessage("t", MessageType::ThreatWarning, PlanarPoint{-3, 8}, "high"), 0, 1);
    receiveMessage(knowledge, memory, makeMessage("h", MessageType::HelpRequest, PlanarPoint{0, 0}, "high"), 0, 1);

    processPendingMessages(knowledge, memory, 40.0, Personality::Social, 2);
    EXPECT_TRUE(knowledge.pending.empty());

    const SocialRecord* r = memory.find("r");
    ASSERT_NE(r, nullptr);
    ASSERT_EQ(r->shared.size(), 1u);
    EXPECT_EQ(r->shared.front().kind, SharedInfoKind::ResourceTip);
    ASSERT_TRUE(knowledge.threatAvoidance.has_value());
    EXPECT_DOUBLE_EQ(knowledge.threatAvoidance->z, 8.0);
    // too hungry to help
    EXPECT_FALSE(knowledge.helpTarget.has_value());

    receiveMessage(knowledge, memory, makeMessage("h", MessageType::HelpRequest, PlanarPoint{0, 0}, "high"), 0, 3);
    processPendingMessages(knowledge, memory, 80.0, Personality::Solitary, 3);
    EXPECT_FALSE(knowledge.helpTarget.has_value());

    receiveMessage(knowledge, memory, makeMessage("h", MessageType::HelpRequest, PlanarPoint{0, 0}, "high"), 0, 4);
    processPendingMessages(knowledge, memory, 80.0, Personality::Curious, 4);
    EXPECT_EQ(knowledge.helpTarget.value_or(""), "h");
}

TEST(SocialMemoryTest, TrustFromVerifications) {
    SocialMemory memory;
    EXPECT_DOUBLE_EQ(memory.averageTrust(), 0.5);
    EXPECT_FALSE(memory.recordVerification("stranger", true, "resource", 1));

    memory.rememberAgent("good", 1);
    memory.rememberAgent("bad", 1);
    memory.recordVerification("good", true, "resource", 2);
    memory.recordVerification("good", true, "threat", 3);
    memory.recordVerification("bad", false, "resource", 2);
    memory.recordVerification("bad", false, "resource", 3);
    memory.recordVerification("bad", false, "resource", 4);

    EXPECT_NEAR(memory.find("good")->trust(), 0.7, 1e-12);
    EXPECT_DOUBLE_EQ(memory.find("bad")->trust(), 0.0);
    EXPECT_NEAR(memory.averageTrust(), 0.35, 1e-12);
}

TEST(SocialMemoryTest, MixedVerificationsOffset) {
    SocialMemory memory;
    memory.rememberAgent("x", 1);
    memory.recordVerification("x", true, "resource", 2);
    memory.recordVerification("x", true, "resource", 3);
    memory.recordVerification("x", false, "threat", 4);
    EXPECT_NEAR(memory.find("x")->trust(), 0.5, 1e-12);
    EXPECT_EQ(memory.find("x")->accurateVerifications(), 2);
    EXPECT_EQ(memory.find("x")->inaccurateVerifications(), 1);
}

TEST(SocialMemoryTest, RememberCountsInteractions) {
    SocialMemory memory;
    Message m = makeMessage("me", MessageType::ThreatWarning, PlanarPoint{0, 0});
    memory.rememberAgent("peer", 3);
    memory.rememberAgent("peer", 9, &m);
    const SocialRecord* rec = memory.find("peer");
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->interactions, 2);
    EXPECT_EQ(rec->firstSeen, 3u);
    EXPECT_EQ(rec->lastSeen, 9u);
    ASSERT_EQ(rec->shared.size(), 1u);
    EXPECT_EQ(rec->shared.front().messageType, MessageType::ThreatWarning);
}

TEST(MessagingTest, BestTipPrefersFresherWithoutReordering) {
    SocialKnowledge knowledge;
    ResourceTip stale;
    stale.location = {1, 0};
    stale.receivedAt = 0;
    ResourceTip fresh;
    fresh.location = {2, 0};
    fresh.receivedAt = 100;
    knowledge.resourceTips.push_back(stale);
    knowledge.resourceTips.push_back(fresh);

    const ResourceTip* best = bestResourceTip(knowledge, 150);
    ASSERT_NE(best, nullptr);
    EXPECT_DOUBLE_EQ(best->location.x, 2.0);
    EXPECT_DOUBLE_EQ(knowledge.resourceTips.front().location.x, 1.0);

    EXPECT_EQ(bestResourceTip(SocialKnowledge{}, 10), nullptr);
}
