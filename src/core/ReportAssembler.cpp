#include "ReportAssembler.h"
#include "ReportWriter.h"
#include "ConfigValidator.h"
#include "Logging.h"
#include "../collectors/ActiveUsersCollector.h"
#include "../collectors/LastLoginsCollector.h"
#include "../collectors/ListeningPortsCollector.h"
#include "../collectors/CloudMetadataCollector.h"

namespace host_audit {

void ReportAssembler::register_collector(CollectorPtr collector){
    collectors_.push_back(std::move(collector));
}

void ReportAssembler::register_all_default(){
    register_collector(std::make_unique<ActiveUsersCollector>());
    register_collector(std::make_unique<LastLoginsCollector>());
    register_collector(std::make_unique<ListeningPortsCollector>());
    register_collector(std::make_unique<CloudMetadataCollector>());
}

Report ReportAssembler::assemble(AuditContext& context, std::chrono::system_clock::time_point now){
    Report report(context.config.report_title, now);
    for(auto& c : collectors_){
        Logger::instance().debug("Starting collector: " + c->name());
        std::optional<ReportSection> section;
        try {
            section = c->collect(context);
        } catch(const std::exception& ex) {
            Logger::instance().error("Collector " + c->name() + " raised: " + ex.what());
        }
        if(section) report.add_section(std::move(*section));
        else Logger::instance().warn(c->name() + " produced no output; section omitted");
        Logger::instance().debug("Finished collector: " + c->name());
    }
    return report;
}

std::optional<std::string> ReportAssembler::run(AuditContext& context, std::chrono::system_clock::time_point now){
    Config cfg = context.config;
    ConfigValidator validator;
    if(!validator.validate(cfg)){
        for(const auto& e : validator.errors()) Logger::instance().error("config: " + e);
        return std::nullopt;
    }
    AuditContext effective(cfg, context.runner);
    Report report = assemble(effective, now);
    ReportWriter writer(cfg);
    return writer.write(report);
}

}
