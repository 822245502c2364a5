#include "ListeningPortsCollector.h"
#include "../core/Logging.h"
#include <sstream>

namespace host_audit {

std::string ListeningPortsCollector::render(const std::vector<ListeningSocket>& sockets){
    if(sockets.empty()) return kNoneFound;
    std::ostringstream os;
    for(size_t i=0;i<sockets.size();++i){
        if(i) os << "\n";
        os << sockets[i].local_address_port << " (" << sockets[i].process_name << ")";
    }
    return os.str();
}

std::optional<ReportSection> ListeningPortsCollector::collect(AuditContext& context){
    Logger::instance().info("Checking for listening ports...");
    // tcp+udp, listening only, numeric, with owning process
    auto result = context.runner.run({"ss", "-tulnp"});
    if(!result.ok()) return std::nullopt;
    auto sockets = SocketReportParser::parse(result.output());
    Logger::instance().debug("Parsed " + std::to_string(sockets.size()) + " listening sockets");
    ReportSection s;
    s.header = kHeader;
    s.body = render(sockets);
    return s;
}

}
