#ifndef MESSAGING_MODULE_H
#define MESSAGING_MODULE_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "modules/Observation.h"
#include "utils/Geometry.h"

class RandomSource;
class IdGenerator;
class SocialMemory;

enum class MessageType : std::uint8_t {
    ResourceLocation = 0,
    ThreatWarning,
    HelpRequest,
    KnowledgeShare,
    AllianceProposal   // reserved, never composed
};

enum class MessagePriority : std::uint8_t {
    Low = 0,
    Normal,
    High
};

enum class Personality : std::uint8_t {
    Cautious = 0,
    Aggressive,
    Social,
    Solitary,
    Curious,
    Conservative,
    COUNT
};

const char* messageTypeName(MessageType type);
const char* messagePriorityName(MessagePriority priority);
const char* personalityName(Personality p);
Personality randomPersonality(RandomSource& rng);

// Payload of a message. Receivers treat every field as untrusted; a missing
// location makes a tip or warning unusable.
struct MessageContent {
    std::string text;
    std::optional<PlanarPoint> location;
    std::string urgency = "normal";
    double detail = 0.0;   // infected count, energy level or tip age, by type
};

struct Message {
    std::string id;
    std::string sender;
    MessageType type = MessageType::KnowledgeShare;
    MessageContent content;
    std::uint64_t timestamp = 0;   // tick
    MessagePriority priority = MessagePriority::Normal;
    double range = 10.0;
};

namespace MessagingConstants {
    constexpr double kMessageRange = 10.0;
    constexpr std::size_t kRecordCapacity = 10;   // per tip/zone/request list
    constexpr double kTipConfidence = 0.8;
    constexpr double kZoneConfidence = 0.7;
    constexpr double kZoneRadius = 5.0;
    constexpr double kInformationDecay = 300.0;   // ticks until a tip is worthless

    constexpr int kThreatCooldown = 15;
    constexpr int kResourceCooldown = 20;
    constexpr int kKnowledgeCooldown = 25;
    constexpr int kHelpCooldown = 30;

    constexpr int kThreatInfectedMin = 3;
    constexpr double kKnowledgeShareChance = 0.1;

    constexpr double kTipVerifyRadius = 3.0;
    constexpr double kTipAccuracyRadius = 5.0;
    constexpr double kZoneVerifyFactor = 1.5;
}

struct ResourceTip {
    PlanarPoint location;
    int receivedAt = 0;          // receiver's age at receipt
    double confidence = MessagingConstants::kTipConfidence;
    std::string source;
    bool checked = false;
    bool verified = false;
};

struct DangerZone {
    PlanarPoint location;
    double radius = MessagingConstants::kZoneRadius;
    int receivedAt = 0;
    double confidence = MessagingConstants::kZoneConfidence;
    std::string source;
    bool checked = false;
    bool verified = false;
};

struct HelpRequest {
    std::string requester;
    std::optional<PlanarPoint> location;
    std::string urgency = "high";
    int receivedAt = 0;
};

// Socially received claims held by one agent, newest first.
struct SocialKnowledge {
    std::deque<ResourceTip> resourceTips;
    std::deque<DangerZone> dangerZones;
    std::deque<HelpRequest> helpRequests;
    std::deque<Message> pending;                  // received, not yet processed
    std::optional<PlanarPoint> threatAvoidance;   // last high-urgency warning
    std::optional<std::string> helpTarget;        // requester this agent may assist
};

// Inputs to the communication waterfall for one agent at one tick.
struct CommunicationContext {
    std::string self;
    Vec3 position{};
    Observation observation{};
    Personality personality = Personality::Cautious;
    int age = 0;
    std::uint64_t tick = 0;
};

struct OutgoingMessage {
    Message message;
    int cooldown = 0;
};

// Priority waterfall, first match wins: threat warning, resource location,
// help request, knowledge share. The knowledge-share roll is only drawn when
// the earlier branches do not match.
std::optional<OutgoingMessage> composeMessage(const CommunicationContext& ctx,
                                              const SocialKnowledge& knowledge,
                                              RandomSource& rng, IdGenerator& ids);

// Stores a received message in the inbox, the pending queue and the
// type-specific lists. Malformed payloads are dropped from the lists.
void receiveMessage(SocialKnowledge& knowledge, SocialMemory& memory,
                    const Message& message, int receiverAge, std::uint64_t tick);

// Drains the pending queue.
void processPendingMessages(SocialKnowledge& knowledge, SocialMemory& memory,
                            double energy, Personality personality, std::uint64_t tick);

// Highest scoring tip, score = confidence * (1 - age / decay).
const ResourceTip* bestResourceTip(const SocialKnowledge& knowledge, int currentAge,
                                   double decay = MessagingConstants::kInformationDecay);

#endif
