#include "kernel/Kernel.h"
#include "io/Snapshot.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

static void printHelp() {
    std::cerr << "Ecosim Commands:\n"
              << "  step N             # advance N ticks (paused: only the player moves)\n"
              << "  state [resources]  # print JSON world view (optional: include resources)\n"
              << "  stats              # print population, health and social statistics\n"
              << "  history            # print population samples as CSV\n"
              << "  inspect ID         # print JSON detail for one agent\n"
              << "  target X Z         # send the player toward (X, Z)\n"
              << "  run                # resume the simulation\n"
              << "  pause              # pause the simulation\n"
              << "  reset [seed]       # reinitialise, optionally with a new seed\n"
              << "  events [N]         # print the N most recent events\n"
              << "  metrics            # print one CSV metrics row\n"
              << "  quit               # exit\n"
              << "\nOptions: --seed=N --causal=N --learners=N --reasoning=P --verbose [script]\n"
              << "The ECOSIM_SEED env var sets the seed unless --seed is given.\n";
}

static void printStats(const Kernel& kernel) {
    const auto s = kernel.statistics();
    std::cout << "\n=== ECOSYSTEM STATISTICS (tick " << s.tick << ") ===\n\n";

    if (kernel.gameOver()) {
        std::cout << "GAME OVER: the player has died.\n";
    }
    if (s.total == 0) {
        std::cout << "Population extinct.\n";
        std::cout.flush();
        return;
    }

    std::cout << std::fixed << std::setprecision(1);
    std::cout << "--- POPULATION ---\n";
    std::cout << "Total agents:    " << s.total << "\n";
    std::cout << "Causal agents:   " << s.causalAgents << "\n";
    std::cout << "Learning agents: " << s.learningAgents << "\n";
    std::cout << "Player:          " << (s.playerAlive ? "alive" : "dead") << "\n";
    std::cout << "Average age:     " << s.avgAge << "\n";
    std::cout << "Average energy:  " << s.avgEnergy << "\n\n";

    std::cout << "--- HEALTH ---\n";
    std::cout << "Susceptible: " << std::setw(4) << s.susceptible
              << " (" << (100.0 * s.susceptible / s.total) << "%)\n";
    std::cout << "Infected:    " << std::setw(4) << s.infected
              << " (" << (100.0 * s.infected / s.total) << "%)\n";
    std::cout << "Recovered:   " << std::setw(4) << s.recovered
              << " (" << (100.0 * s.recovered / s.total) << "%)\n\n";

    std::cout << "--- SOCIAL ---\n";
    std::cout << "Reasoning events:     " << s.reasoningEvents << "\n";
    std::cout << "Communication events: " << s.communicationEvents << "\n";
    std::cout << "Active messages:      " << s.activeMessages << "\n";
    std::cout << "Average trust:        " << std::setprecision(3) << s.averageTrust << "\n\n";

    std::cout << "--- ENVIRONMENT ---\n";
    std::cout << "Season:      " << seasonName(s.season) << "\n";
    std::cout << "Weather:     " << weatherName(s.weather) << "\n";
    std::cout << "Temperature: " << std::setprecision(1) << s.temperature << "\n";
    std::cout << "Resources:   " << s.resources << "\n\n";
    std::cout.flush();
}

static bool parseFlag(const std::string& arg, const char* name, std::string& value) {
    const std::string prefix = std::string(name) + "=";
    if (arg.rfind(prefix, 0) != 0) return false;
    value = arg.substr(prefix.size());
    return true;
}

int main(int argc, char** argv) {
    KernelConfig cfg;

    if (const char* envSeed = std::getenv("ECOSIM_SEED")) {
        try {
            cfg.seed = std::stoull(envSeed);
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid ECOSIM_SEED '" << envSeed << "'\n";
        }
    }

    const char* scriptArg = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        try {
            if (parseFlag(arg, "--seed", value)) {
                cfg.seed = std::stoull(value);
            } else if (parseFlag(arg, "--causal", value)) {
                cfg.causalAgents = std::stoi(value);
            } else if (parseFlag(arg, "--learners", value)) {
                cfg.learningAgents = std::stoi(value);
            } else if (parseFlag(arg, "--reasoning", value)) {
                cfg.reasoningFrequency = std::stod(value);
            } else if (arg == "--verbose") {
                cfg.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            return 1;
        }
    }

    std::unique_ptr<Kernel> kernelPtr;
    try {
        kernelPtr = std::make_unique<Kernel>(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }
    Kernel& kernel = *kernelPtr;
    std::cerr << "Reasoning workers: " << ReasoningQueue::workerCount() << "\n";

    std::istream* input = &std::cin;
    std::ifstream scriptFile;
    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }

        if (cmd == "step") {
            int n = 1;
            iss >> n;
            if (n < 1) n = 1;
            for (int i = 0; i < n; ++i) {
                kernel.step();
                if ((i + 1) % 100 == 0 || i == n - 1) {
                    std::cerr << "Tick " << (i + 1) << "/" << n << "\r";
                    std::cerr.flush();
                }
                if (kernel.gameOver() || kernel.extinct()) break;
            }
            std::cerr << "\n";
            if (kernel.gameOver()) std::cerr << "Game over at tick " << kernel.tick() << "\n";
            if (kernel.extinct()) std::cerr << "Population extinct at tick " << kernel.tick() << "\n";
            std::cout << kernelToJson(kernel) << "\n";
            std::cout.flush();

        } else if (cmd == "state") {
            std::string opt;
            iss >> opt;
            std::cout << kernelToJson(kernel, opt == "resources") << "\n";
            std::cout.flush();

        } else if (cmd == "stats") {
            printStats(kernel);

        } else if (cmd == "history") {
            logHistory(kernel, std::cout);
            std::cout.flush();

        } else if (cmd == "inspect") {
            std::string id;
            if (!(iss >> id)) {
                std::cerr << "Usage: inspect ID\n";
                continue;
            }
            auto info = kernel.inspectAgent(id);
            if (!info) {
                std::cerr << "No agent with id '" << id << "'\n";
                continue;
            }
            std::cout << inspectionToJson(*info) << "\n";
            std::cout.flush();

        } else if (cmd == "target") {
            double x = 0.0;
            double z = 0.0;
            if (!(iss >> x >> z)) {
                std::cerr << "Usage: target X Z\n";
                continue;
            }
            if (!kernel.setPlayerTarget(x, z)) {
                std::cerr << "No player in the simulation\n";
            }

        } else if (cmd == "run") {
            kernel.setRunning(true);
            if (!kernel.running()) {
                std::cerr << "Simulation has ended; use 'reset' to start over\n";
            }

        } else if (cmd == "pause") {
            kernel.setRunning(false);

        } else if (cmd == "reset") {
            KernelConfig newCfg = kernel.config();
            std::uint64_t seed = 0;
            if (iss >> seed) {
                newCfg.seed = seed;
            }
            try {
                kernel.reset(newCfg);
                std::cerr << "Reset with seed " << newCfg.seed << "\n";
            } catch (const std::invalid_argument& e) {
                std::cerr << "Reset failed: " << e.what() << "\n";
            }

        } else if (cmd == "events") {
            std::size_t n = 20;
            std::size_t requested = 0;
            if (iss >> requested) n = requested;
            for (const auto& e : kernel.eventLog().recent(n)) {
                std::cout << e.tick << "," << eventTypeName(e.type) << "," << e.agent << "," << e.detail << "\n";
            }
            std::cout.flush();

        } else if (cmd == "metrics") {
            std::cout << std::fixed << std::setprecision(3);
            writeMetricsHeader(std::cout);
            logMetrics(kernel, std::cout);
            std::cout.flush();

        } else if (cmd == "quit" || cmd == "exit") {
            break;

        } else if (cmd == "help") {
            printHelp();

        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
        }
    }

    return 0;
}
