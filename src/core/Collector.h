#pragma once
#include "CommandRunner.h"
#include "Config.h"
#include "Report.h"
#include <memory>
#include <optional>
#include <string>

namespace host_audit {

struct AuditContext {
    AuditContext(const Config& cfg, CommandRunner& r): config(cfg), runner(r) {}
    const Config& config;
    CommandRunner& runner;
};

// One probe contributing at most one report section. nullopt means the
// probe could not run and its section is absent from the report.
class Collector {
public:
    virtual ~Collector() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::optional<ReportSection> collect(AuditContext& context) = 0;
};

using CollectorPtr = std::unique_ptr<Collector>;

// Failure -> absent; empty output -> none_found message; else the output verbatim.
std::optional<ReportSection> text_section(const CommandResult& result, const std::string& header, const std::string& none_found);

}
