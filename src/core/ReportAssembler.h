#pragma once
#include "Collector.h"
#include "Report.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace host_audit {

class ReportAssembler {
public:
    void register_collector(CollectorPtr collector);
    // active users, last logins, listening ports, cloud metadata
    void register_all_default();
    size_t collector_count() const { return collectors_.size(); }

    // Runs every collector once, in registration order, dropping absent sections.
    Report assemble(AuditContext& context, std::chrono::system_clock::time_point now);

    // Validates and normalizes context.config, then assemble() + ReportWriter::write().
    // Returns the written path; nullopt (nothing run) when the config is unusable.
    std::optional<std::string> run(AuditContext& context, std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
private:
    std::vector<CollectorPtr> collectors_;
};

}
