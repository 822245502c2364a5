#pragma once
#include "../core/Collector.h"
#include <vector>

namespace host_audit {

class LastLoginsCollector : public Collector {
public:
    static constexpr const char* kNoneFound = "No login history found.";

    std::string name() const override { return "last_logins"; }
    std::string description() const override { return "Most recent login records (last -n N)"; }
    std::optional<ReportSection> collect(AuditContext& context) override;

    static std::vector<std::string> command(const Config& cfg);
    static std::string header(const Config& cfg);
};

}
