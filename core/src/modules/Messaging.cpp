#include "modules/Messaging.h"

#include <algorithm>
#include <utility>

#include "modules/SocialMemory.h"
#include "utils/IdGenerator.h"
#include "utils/Random.h"

namespace {
template <typename T>
void pushCapped(std::deque<T>& list, T item) {
    list.push_front(std::move(item));
    if (list.size() > MessagingConstants::kRecordCapacity) {
        list.pop_back();
    }
}

Message makeMessage(const CommunicationContext& ctx, IdGenerator& ids, MessageType type,
                    MessagePriority priority, std::string text, std::string urgency) {
    Message m;
    m.id = ids.next("msg");
    m.sender = ctx.self;
    m.type = type;
    m.priority = priority;
    m.timestamp = ctx.tick;
    m.range = MessagingConstants::kMessageRange;
    m.content.text = std::move(text);
    m.content.urgency = std::move(urgency);
    m.content.location = PlanarPoint{ctx.position.x, ctx.position.z};
    return m;
}
}

const char* messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::ResourceLocation: return "RESOURCE_LOCATION";
        case MessageType::ThreatWarning: return "THREAT_WARNING";
        case MessageType::HelpRequest: return "HELP_REQUEST";
        case MessageType::KnowledgeShare: return "KNOWLEDGE_SHARE";
        case MessageType::AllianceProposal: return "ALLIANCE_PROPOSAL";
    }
    return "UNKNOWN";
}

const char* messagePriorityName(MessagePriority priority) {
    switch (priority) {
        case MessagePriority::Low: return "low";
        case MessagePriority::Normal: return "normal";
        case MessagePriority::High: return "high";
    }
    return "normal";
}

const char* personalityName(Personality p) {
    switch (p) {
        case Personality::Cautious: return "cautious";
        case Personality::Aggressive: return "aggressive";
        case Personality::Social: return "social";
        case Personality::Solitary: return "solitary";
        case Personality::Curious: return "curious";
        case Personality::Conservative: return "conservative";
        default: return "cautious";
    }
}

Personality randomPersonality(RandomSource& rng) {
    return static_cast<Personality>(rng.index(static_cast<std::size_t>(Personality::COUNT)));
}

std::optional<OutgoingMessage> composeMessage(const CommunicationContext& ctx,
                                              const SocialKnowledge& knowledge,
                                              RandomSource& rng, IdGenerator& ids) {
    using namespace MessagingConstants;
    const Observation& obs = ctx.observation;

    if (obs.nearbyInfected >= kThreatInfectedMin && obs.status == HealthStatus::Susceptible) {
        Message m = makeMessage(ctx, ids, MessageType::ThreatWarning, MessagePriority::High,
                                "Warning: " + std::to_string(obs.nearbyInfected) + " infected agents here!",
                                "high");
        m.content.detail = obs.nearbyInfected;
        return OutgoingMessage{std::move(m), kThreatCooldown};
    }

    if (obs.nearestResourceDistance < 3.0 && obs.energy > 50.0) {
        Message m = makeMessage(ctx, ids, MessageType::ResourceLocation, MessagePriority::Normal,
                                "Found abundant resources here!", "normal");
        return OutgoingMessage{std::move(m), kResourceCooldown};
    }

    if (obs.energy < 20.0 && ctx.personality != Personality::Solitary) {
        Message m = makeMessage(ctx, ids, MessageType::HelpRequest, MessagePriority::High,
                                "Need help! Energy critical!", "high");
        m.content.detail = obs.energy;
        return OutgoingMessage{std::move(m), kHelpCooldown};
    }

    if (rng.chance(kKnowledgeShareChance) && !knowledge.resourceTips.empty()) {
        // newest tip is at the front
        const ResourceTip& tip = knowledge.resourceTips.front();
        Message m = makeMessage(ctx, ids, MessageType::KnowledgeShare, MessagePriority::Low,
                                "I know of resources elsewhere", "low");
        m.content.location = tip.location;
        m.content.detail = ctx.age - tip.receivedAt;
        return OutgoingMessage{std::move(m), kKnowledgeCooldown};
    }

    return std::nullopt;
}

void receiveMessage(SocialKnowledge& knowledge, SocialMemory& memory,
                    const Message& message, int receiverAge, std::uint64_t tick) {
    knowledge.pending.push_back(message);
    memory.addReceivedMessage(message);
    memory.rememberAgent(message.sender, tick);

    const auto& loc = message.content.location;
    switch (message.type) {
        case MessageType::ResourceLocation:
            if (loc) {
                ResourceTip tip;
                tip.location = *loc;
                tip.receivedAt = receiverAge;
                tip.source = message.sender;
                pushCapped(knowledge.resourceTips, std::move(tip));
            }
            break;
        case MessageType::ThreatWarning:
            if (loc) {
                DangerZone zone;
                zone.location = *loc;
                zone.receivedAt = receiverAge;
                zone.source = message.sender;
                pushCapped(knowledge.dangerZones, std::move(zone));
            }
            break;
        case MessageType::HelpRequest: {
            HelpRequest request;
            request.requester = message.sender;
            request.location = loc;
            request.urgency = message.content.urgency.empty() ? "high" : message.content.urgency;
            request.receivedAt = receiverAge;
            pushCapped(knowledge.helpRequests, std::move(request));
            break;
        }
        default:
            break;
    }
}

void processPendingMessages(SocialKnowledge& knowledge, SocialMemory& memory,
                            double energy, Personality personality, std::uint64_t tick) {
    while (!knowledge.pending.empty()) {
        Message message = std::move(knowledge.pending.front());
        knowledge.pending.pop_front();

        switch (message.type) {
            case MessageType::ResourceLocation:
                if (energy < 50.0) {
                    memory.recordResourceTip(message.sender, message.content.location, tick);
                }
                break;
            case MessageType::ThreatWarning:
                if (message.content.urgency == "high" && message.content.location) {
                    knowledge.threatAvoidance = message.content.location;
                }
                break;
            case MessageType::HelpRequest:
                if (energy > 70.0 && personality != Personality::Solitary) {
                    knowledge.helpTarget = message.sender;
                }
                break;
            default:
                break;
        }
    }
}

const ResourceTip* bestResourceTip(const SocialKnowledge& knowledge, int currentAge, double decay) {
    const ResourceTip* best = nullptr;
    double bestScore = 0.0;
    for (const auto& tip : knowledge.resourceTips) {
        const double age = std::max(0, currentAge - tip.receivedAt);
        const double score = tip.confidence * (1.0 - age / decay);
        if (!best || score > bestScore) {
            best = &tip;
            bestScore = score;
        }
    }
    return best;
}
