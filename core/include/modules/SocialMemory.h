#ifndef SOCIAL_MEMORY_H
#define SOCIAL_MEMORY_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "modules/Messaging.h"

enum class SharedInfoKind : std::uint8_t {
    Message = 0,       // a message exchanged with this agent
    ResourceTip,       // a tip acted upon while hungry
    Verification       // a ground-truth check of this agent's claim
};

struct SharedInfo {
    SharedInfoKind kind = SharedInfoKind::Message;
    MessageType messageType = MessageType::KnowledgeShare;
    std::string subject;                 // "resource" or "threat" for verifications
    bool accurate = false;
    std::optional<PlanarPoint> location;
    std::uint64_t tick = 0;
};

struct SocialRecord {
    std::uint64_t firstSeen = 0;
    std::uint64_t lastSeen = 0;
    int interactions = 0;
    std::vector<SharedInfo> shared;

    int accurateVerifications() const;
    int inaccurateVerifications() const;
    double trust() const;
};

namespace TrustConstants {
    constexpr double kBaseTrust = 0.5;
    constexpr double kAccurateDelta = 0.1;
    constexpr double kInaccurateDelta = -0.2;
    constexpr std::size_t kInboxCapacity = 20;
}

// What one agent remembers about its peers. Records live as long as the
// owning agent.
class SocialMemory {
public:
    // Creates the record on first contact, then counts one interaction.
    void rememberAgent(const std::string& agentId, std::uint64_t tick,
                       const Message* interaction = nullptr);

    void addReceivedMessage(const Message& message);
    std::vector<Message> recentMessages(std::size_t count = 5) const;

    // Attaches a verification to an already known source. Returns false when
    // the source is unknown.
    bool recordVerification(const std::string& source, bool accurate,
                            const std::string& subject, std::uint64_t tick);
    bool recordResourceTip(const std::string& source, const std::optional<PlanarPoint>& location,
                           std::uint64_t tick);

    const SocialRecord* find(const std::string& agentId) const;
    std::size_t knownCount() const { return known_.size(); }
    const std::map<std::string, SocialRecord>& known() const { return known_; }
    const std::deque<Message>& inbox() const { return inbox_; }

    // Unweighted mean of per-sender trust; kBaseTrust with nobody known.
    double averageTrust() const;

private:
    std::map<std::string, SocialRecord> known_;
    std::deque<Message> inbox_;
};

#endif
