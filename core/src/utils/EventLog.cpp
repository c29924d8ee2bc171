#include "utils/EventLog.h"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::Birth: return "birth";
        case EventType::Death: return "death";
        case EventType::Infection: return "infection";
        case EventType::Recovery: return "recovery";
        case EventType::Message: return "message";
        case EventType::Reasoning: return "reasoning";
        case EventType::GameOver: return "game_over";
        case EventType::Extinction: return "extinction";
        default: return "unknown";
    }
}

void EventLog::setCapacity(std::size_t capacity) {
    capacity_ = capacity;
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

void EventLog::clear() {
    events_.clear();
    totals_.fill(0);
}

void EventLog::logBirth(std::uint64_t tick, const std::string& child, const std::string& parent) {
    record(tick, EventType::Birth, child, "parent=" + parent);
}

void EventLog::logDeath(std::uint64_t tick, const std::string& agent, int age, double energy) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << "age=" << age << " energy=" << energy;
    record(tick, EventType::Death, agent, os.str());
}

void EventLog::logInfection(std::uint64_t tick, const std::string& agent) {
    record(tick, EventType::Infection, agent, "");
}

void EventLog::logRecovery(std::uint64_t tick, const std::string& agent) {
    record(tick, EventType::Recovery, agent, "");
}

void EventLog::logMessage(std::uint64_t tick, const std::string& sender, const char* type, int recipients) {
    record(tick, EventType::Message, sender, std::string(type) + " recipients=" + std::to_string(recipients));
}

void EventLog::logReasoning(std::uint64_t tick, const std::string& agent, const std::string& decision) {
    record(tick, EventType::Reasoning, agent, decision);
}

void EventLog::logGameOver(std::uint64_t tick, const std::string& agent) {
    record(tick, EventType::GameOver, agent, "player died");
}

void EventLog::logExtinction(std::uint64_t tick) {
    record(tick, EventType::Extinction, "", "population reached zero");
}

std::vector<Event> EventLog::recent(std::size_t n) const {
    const std::size_t count = std::min(n, events_.size());
    return std::vector<Event>(events_.end() - static_cast<std::ptrdiff_t>(count), events_.end());
}

void EventLog::record(std::uint64_t tick, EventType type, const std::string& agent, std::string detail) {
    totals_[static_cast<std::size_t>(type)]++;
    if (echo_) {
        *echo_ << "[" << tick << "] " << eventTypeName(type);
        if (!agent.empty()) *echo_ << " " << agent;
        if (!detail.empty()) *echo_ << " " << detail;
        *echo_ << "\n";
    }
    if (capacity_ == 0) return;
    events_.push_back(Event{tick, type, agent, std::move(detail)});
    if (events_.size() > capacity_) {
        events_.pop_front();
    }
}
