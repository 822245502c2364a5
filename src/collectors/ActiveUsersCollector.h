#pragma once
#include "../core/Collector.h"

namespace host_audit {

class ActiveUsersCollector : public Collector {
public:
    static constexpr const char* kHeader = "--- Active Users ---";
    static constexpr const char* kNoneFound = "No active users found.";

    std::string name() const override { return "active_users"; }
    std::string description() const override { return "Users currently logged in (who)"; }
    std::optional<ReportSection> collect(AuditContext& context) override;
};

}
