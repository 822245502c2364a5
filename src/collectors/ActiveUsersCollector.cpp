#include "ActiveUsersCollector.h"
#include "../core/Logging.h"

namespace host_audit {

std::optional<ReportSection> ActiveUsersCollector::collect(AuditContext& context){
    Logger::instance().info("Checking for active users...");
    return text_section(context.runner.run({"who"}), kHeader, kNoneFound);
}

}
