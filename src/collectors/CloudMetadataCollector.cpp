#include "CloudMetadataCollector.h"
#include "../core/Logging.h"

namespace host_audit {

std::vector<std::string> CloudMetadataCollector::command(const Config& cfg){
    return {"curl", "-s",
            "--connect-timeout", std::to_string(cfg.metadata_connect_timeout_seconds),
            "--max-time", std::to_string(cfg.metadata_max_time_seconds),
            cfg.metadata_url};
}

std::optional<ReportSection> CloudMetadataCollector::collect(AuditContext& context){
    Logger::instance().info("Checking cloud metadata service...");
    RunOptions opts;
    opts.suppress_error_output = true; // unreachable is the normal outcome off-cloud
    auto result = context.runner.run(command(context.config), opts);
    bool reachable = result.ok() && !result.output().empty();
    if(!result.ok()) Logger::instance().debug(std::string("metadata probe failed (") + failure_kind_name(result.failure().kind) + "): " + describe(result.failure()));
    ReportSection s;
    s.header = kHeader;
    s.body = reachable ? kReachable : kUnreachable;
    return s;
}

}
