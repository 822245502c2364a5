#pragma once
#include "../core/Collector.h"
#include "../core/SocketReportParser.h"
#include <vector>

namespace host_audit {

class ListeningPortsCollector : public Collector {
public:
    static constexpr const char* kHeader = "--- Listening Ports ---";
    static constexpr const char* kNoneFound = "No listening ports found.";

    std::string name() const override { return "listening_ports"; }
    std::string description() const override { return "Listening TCP/UDP sockets and owning processes (ss)"; }
    std::optional<ReportSection> collect(AuditContext& context) override;

    static std::string render(const std::vector<ListeningSocket>& sockets);
};

}
