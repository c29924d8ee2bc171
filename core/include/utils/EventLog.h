#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <string>
#include <vector>

enum class EventType : std::uint8_t {
    Birth = 0,
    Death,
    Infection,
    Recovery,
    Message,
    Reasoning,
    GameOver,
    Extinction,
    COUNT
};

const char* eventTypeName(EventType type);

struct Event {
    std::uint64_t tick = 0;
    EventType type = EventType::Birth;
    std::string agent;
    std::string detail;
};

// Bounded record of notable simulation events. Totals per type survive
// eviction from the window. When an echo stream is set every event is also
// written there as one line.
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 512) : capacity_(capacity) {}

    void setCapacity(std::size_t capacity);
    void setEcho(std::ostream* out) { echo_ = out; }
    void clear();

    void logBirth(std::uint64_t tick, const std::string& child, const std::string& parent);
    void logDeath(std::uint64_t tick, const std::string& agent, int age, double energy);
    void logInfection(std::uint64_t tick, const std::string& agent);
    void logRecovery(std::uint64_t tick, const std::string& agent);
    void logMessage(std::uint64_t tick, const std::string& sender, const char* type, int recipients);
    void logReasoning(std::uint64_t tick, const std::string& agent, const std::string& decision);
    void logGameOver(std::uint64_t tick, const std::string& agent);
    void logExtinction(std::uint64_t tick);

    const std::deque<Event>& events() const { return events_; }
    std::vector<Event> recent(std::size_t n) const;
    std::uint64_t total(EventType type) const { return totals_[static_cast<std::size_t>(type)]; }

private:
    void record(std::uint64_t tick, EventType type, const std::string& agent, std::string detail);

    std::size_t capacity_;
    std::deque<Event> events_;
    std::array<std::uint64_t, static_cast<std::size_t>(EventType::COUNT)> totals_{};
    std::ostream* echo_ = nullptr;
};

#endif
