#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>

namespace {
std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c;
        }
    }
    out += "\"";
    return out;
}

void writeTrace(std::ostream& os, const ReasoningTrace& t) {
    os << "{";
    os << "\"tick\":" << t.tick << ",";
    os << "\"age\":" << t.age << ",";
    os << "\"action\":" << quoted(actionTypeName(t.intent.type)) << ",";
    os << "\"speed\":" << t.intent.speed << ",";
    os << "\"confidence\":" << t.confidence << ",";
    os << "\"reasoning\":" << quoted(t.reasoning) << ",";
    os << "\"thoughts\":[";
    for (std::size_t i = 0; i < t.chain.thoughts.size(); ++i) {
        const auto& th = t.chain.thoughts[i];
        os << "{\"step\":" << th.step << ",\"type\":" << quoted(th.type)
           << ",\"content\":" << quoted(th.content) << "}";
        if (i + 1 < t.chain.thoughts.size()) os << ",";
    }
    os << "]}";
}

void writeCommunication(std::ostream& os, const LastCommunication& c) {
    os << "{\"type\":" << quoted(messageTypeName(c.type))
       << ",\"text\":" << quoted(c.text)
       << ",\"recipients\":" << c.recipients
       << ",\"tick\":" << c.tick << "}";
}
}

std::string worldToJson(const WorldView& view, bool includeResources) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    os << "{";
    os << "\"tick\":" << view.tick << ",";
    os << "\"running\":" << (view.running ? "true" : "false") << ",";
    os << "\"gameOver\":" << (view.gameOver ? "true" : "false") << ",";
    os << "\"extinct\":" << (view.extinct ? "true" : "false") << ",";

    const auto& env = view.environment;
    os << "\"environment\":{";
    os << "\"season\":" << quoted(seasonName(env.season)) << ",";
    os << "\"weather\":" << quoted(weatherName(env.weather)) << ",";
    os << "\"temperature\":" << env.temperature << ",";
    os << "\"cycleStep\":" << env.cycleStep << ",";
    os << "\"resourceCount\":" << env.resources.size();
    if (includeResources) {
        os << ",\"resources\":[";
        for (std::size_t i = 0; i < env.resources.size(); ++i) {
            const auto& r = env.resources[i];
            os << "{\"id\":" << quoted(r.id) << ",\"x\":" << r.position.x << ",\"z\":" << r.position.z
               << ",\"value\":" << r.value << ",\"quality\":" << r.quality << "}";
            if (i + 1 < env.resources.size()) os << ",";
        }
        os << "]";
    }
    os << "},";

    os << "\"agents\":[";
    for (std::size_t i = 0; i < view.agents.size(); ++i) {
        const auto& a = view.agents[i];
        os << "{";
        os << "\"id\":" << quoted(a.id) << ",";
        os << "\"kind\":" << quoted(agentKindName(a.kind)) << ",";
        os << "\"position\":[" << a.position.x << "," << a.position.y << "," << a.position.z << "],";
        os << "\"status\":" << quoted(healthStatusName(a.status)) << ",";
        os << "\"color\":" << quoted(a.colorClass) << ",";
        os << "\"energy\":" << a.energy << ",";
        os << "\"age\":" << a.age << ",";
        os << "\"active\":" << (a.isActive ? "true" : "false");
        if (a.lastReasoning) {
            os << ",\"lastReasoning\":";
            writeTrace(os, *a.lastReasoning);
        }
        if (a.lastCommunication) {
            os << ",\"lastCommunication\":";
            writeCommunication(os, *a.lastCommunication);
        }
        os << "}";
        if (i + 1 < view.agents.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

std::string kernelToJson(const Kernel& kernel, bool includeResources) {
    return worldToJson(kernel.view(), includeResources);
}

std::string inspectionToJson(const AgentInspection& info) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    os << "{";
    os << "\"id\":" << quoted(info.id) << ",";
    os << "\"kind\":" << quoted(agentKindName(info.kind)) << ",";
    if (info.personality) {
        os << "\"personality\":" << quoted(personalityName(*info.personality)) << ",";
    }
    os << "\"position\":[" << info.position.x << "," << info.position.y << "," << info.position.z << "],";
    os << "\"status\":" << quoted(healthStatusName(info.status)) << ",";
    os << "\"infectionTimer\":" << info.infectionTimer << ",";
    os << "\"energy\":" << info.energy << ",";
    os << "\"age\":" << info.age << ",";
    os << "\"lifespan\":" << info.genotype.lifespan << ",";
    os << "\"reproductionCooldown\":" << info.reproductionCooldown << ",";
    os << "\"qTableSize\":" << info.qTableSize;

    if (info.kind == AgentKind::Causal) {
        os << ",\"decisionCount\":" << info.decisionCount;
        os << ",\"reasoningPending\":" << (info.reasoningPending ? "true" : "false");
        os << ",\"communicationCooldown\":" << info.communicationCooldown;
        os << ",\"social\":{";
        os << "\"resourceTips\":" << info.resourceTips << ",";
        os << "\"verifiedTips\":" << info.verifiedTips << ",";
        os << "\"dangerZones\":" << info.dangerZones << ",";
        os << "\"helpRequests\":" << info.helpRequests << ",";
        os << "\"knownAgents\":" << info.knownAgents << ",";
        os << "\"averageTrust\":" << info.averageTrust << ",";
        os << "\"trust\":{";
        std::size_t n = 0;
        for (const auto& [source, trust] : info.trustBySource) {
            os << quoted(source) << ":" << trust;
            if (++n < info.trustBySource.size()) os << ",";
        }
        os << "}}";

        os << ",\"recentMessages\":[";
        for (std::size_t i = 0; i < info.recentMessages.size(); ++i) {
            const auto& m = info.recentMessages[i];
            os << "{\"sender\":" << quoted(m.sender) << ",\"type\":" << quoted(messageTypeName(m.type))
               << ",\"text\":" << quoted(m.content.text) << ",\"tick\":" << m.timestamp << "}";
            if (i + 1 < info.recentMessages.size()) os << ",";
        }
        os << "]";

        if (info.lastCommunication) {
            os << ",\"lastCommunication\":";
            writeCommunication(os, *info.lastCommunication);
        }
        if (info.lastReasoning) {
            os << ",\"lastReasoning\":";
            writeTrace(os, *info.lastReasoning);
        }
        os << ",\"reasoningHistory\":[";
        for (std::size_t i = 0; i < info.reasoningHistory.size(); ++i) {
            const auto& t = info.reasoningHistory[i];
            os << "{\"tick\":" << t.tick << ",\"action\":" << quoted(actionTypeName(t.intent.type))
               << ",\"reasoning\":" << quoted(t.reasoning) << "}";
            if (i + 1 < info.reasoningHistory.size()) os << ",";
        }
        os << "]";
        os << ",\"reasoningPrompt\":" << quoted(info.reasoningPrompt);
    }
    if (info.target) {
        os << ",\"target\":[" << info.target->x << "," << info.target->z << "]";
    }
    os << "}";
    return os.str();
}

void writeMetricsHeader(std::ostream& out) {
    out << "tick,total,susceptible,infected,recovered,causal,learning,avgAge,avgEnergy,"
           "reasoningEvents,communicationEvents,activeMessages,avgTrust,resources,season,weather\n";
}

void logMetrics(const Kernel& kernel, std::ostream& out) {
    const auto s = kernel.statistics();
    out << s.tick << ","
        << s.total << ","
        << s.susceptible << ","
        << s.infected << ","
        << s.recovered << ","
        << s.causalAgents << ","
        << s.learningAgents << ","
        << s.avgAge << ","
        << s.avgEnergy << ","
        << s.reasoningEvents << ","
        << s.communicationEvents << ","
        << s.activeMessages << ","
        << s.averageTrust << ","
        << s.resources << ","
        << seasonName(s.season) << ","
        << weatherName(s.weather) << "\n";
}

void logHistory(const Kernel& kernel, std::ostream& out) {
    out << "tick,total,susceptible,infected,recovered\n";
    for (const auto& h : kernel.populationHistory()) {
        out << h.tick << "," << h.total << "," << h.susceptible << ","
            << h.infected << "," << h.recovered << "\n";
    }
}
