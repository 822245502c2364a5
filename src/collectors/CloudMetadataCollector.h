#pragma once
#include "../core/Collector.h"
#include <vector>

namespace host_audit {

// Always yields a section: reachability of the link-local metadata endpoint
// is a positive signal, anything else a negative one.
class CloudMetadataCollector : public Collector {
public:
    static constexpr const char* kHeader = "--- Cloud Metadata Check ---";
    static constexpr const char* kReachable = "Metadata service reachable: likely a cloud instance.";
    static constexpr const char* kUnreachable = "Metadata service not reachable: likely not a cloud instance.";

    std::string name() const override { return "cloud_metadata"; }
    std::string description() const override { return "Reachability of the cloud instance metadata service"; }
    std::optional<ReportSection> collect(AuditContext& context) override;

    static std::vector<std::string> command(const Config& cfg);
};

}
