#ifndef KERNEL_SNAPSHOT_H
#define KERNEL_SNAPSHOT_H

#include "kernel/Kernel.h"
#include <string>
#include <iosfwd>

// JSON export for world state
std::string worldToJson(const WorldView& view, bool includeResources = true);
std::string kernelToJson(const Kernel& kernel, bool includeResources = false);
std::string inspectionToJson(const AgentInspection& info);

// CSV metrics logging
void writeMetricsHeader(std::ostream& out);
void logMetrics(const Kernel& kernel, std::ostream& out);
void logHistory(const Kernel& kernel, std::ostream& out);

#endif
