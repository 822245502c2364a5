#include "LastLoginsCollector.h"
#include "../core/Logging.h"

namespace host_audit {

std::vector<std::string> LastLoginsCollector::command(const Config& cfg){
    return {"last", "-n", std::to_string(cfg.last_login_count)};
}

std::string LastLoginsCollector::header(const Config& cfg){
    return "--- Last " + std::to_string(cfg.last_login_count) + " Logins ---";
}

std::optional<ReportSection> LastLoginsCollector::collect(AuditContext& context){
    Logger::instance().info("Retrieving last " + std::to_string(context.config.last_login_count) + " logins...");
    return text_section(context.runner.run(command(context.config)), header(context.config), kNoneFound);
}

}
