#include "modules/SocialMemory.h"

#include <algorithm>

int SocialRecord::accurateVerifications() const {
    return static_cast<int>(std::count_if(shared.begin(), shared.end(), [](const SharedInfo& info) {
        return info.kind == SharedInfoKind::Verification && info.accurate;
    }));
}

int SocialRecord::inaccurateVerifications() const {
    return static_cast<int>(std::count_if(shared.begin(), shared.end(), [](const SharedInfo& info) {
        return info.kind == SharedInfoKind::Verification && !info.accurate;
    }));
}

double SocialRecord::trust() const {
    double t = TrustConstants::kBaseTrust;
    t += TrustConstants::kAccurateDelta * accurateVerifications();
    t += TrustConstants::kInaccurateDelta * inaccurateVerifications();
    return std::clamp(t, 0.0, 1.0);
}

void SocialMemory::rememberAgent(const std::string& agentId, std::uint64_t tick, const Message* interaction) {
    auto [it, inserted] = known_.try_emplace(agentId);
    SocialRecord& record = it->second;
    if (inserted) {
        record.firstSeen = tick;
    }
    record.interactions++;
    record.lastSeen = tick;

    if (interaction) {
        SharedInfo info;
        info.kind = SharedInfoKind::Message;
        info.messageType = interaction->type;
        info.tick = tick;
        record.shared.push_back(info);
    }
}

void SocialMemory::addReceivedMessage(const Message& message) {
    inbox_.push_back(message);
    if (inbox_.size() > TrustConstants::kInboxCapacity) {
        inbox_.pop_front();
    }
}

std::vector<Message> SocialMemory::recentMessages(std::size_t count) const {
    const std::size_t n = std::min(count, inbox_.size());
    return std::vector<Message>(inbox_.end() - static_cast<std::ptrdiff_t>(n), inbox_.end());
}

bool SocialMemory::recordVerification(const std::string& source, bool accurate,
                                      const std::string& subject, std::uint64_t tick) {
    auto it = known_.find(source);
    if (it == known_.end()) {
        return false;
    }
    SharedInfo info;
    info.kind = SharedInfoKind::Verification;
    info.subject = subject;
    info.accurate = accurate;
    info.tick = tick;
    it->second.shared.push_back(info);
    return true;
}

bool SocialMemory::recordResourceTip(const std::string& source, const std::optional<PlanarPoint>& location,
                                     std::uint64_t tick) {
    auto it = known_.find(source);
    if (it == known_.end()) {
        return false;
    }
    SharedInfo info;
    info.kind = SharedInfoKind::ResourceTip;
    info.messageType = MessageType::ResourceLocation;
    info.location = location;
    info.tick = tick;
    it->second.shared.push_back(info);
    return true;
}

const SocialRecord* SocialMemory::find(const std::string& agentId) const {
    auto it = known_.find(agentId);
    return it == known_.end() ? nullptr : &it->second;
}

double SocialMemory::averageTrust() const {
    if (known_.empty()) {
        return TrustConstants::kBaseTrust;
    }
    double total = 0.0;
    for (const auto& [id, record] : known_) {
        total += record.trust();
    }
    return total / static_cast<double>(known_.size());
}
