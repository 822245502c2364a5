#include "core/CommandRunner.h"
#include "core/Config.h"
#include "core/Logging.h"
#include "core/ReportAssembler.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <chrono>
#include <exception>
#include <string>

using namespace host_audit;

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    try {
        if(argc > 1){
            std::string ignored;
            for(int i=1;i<argc;++i){ if(i>1) ignored += ' '; ignored += argv[i]; }
            Logger::instance().warn("host-audit takes no arguments; ignoring: " + ignored);
        }

        Config cfg;
        set_config(cfg);
        Logger::instance().set_level(cfg.log_level);
        Logger::instance().debug(std::string("log level: ") + log_level_name(cfg.log_level));
        Logger::instance().debug(std::string("host-audit ") + buildinfo::APP_VERSION + " (compiler=" + buildinfo::COMPILER_ID + " " + buildinfo::COMPILER_VERSION + ", cxx_std=" + buildinfo::CXX_STANDARD + ")");

        Logger::instance().info("--- Running host security audit ---");
        ProcessCommandRunner runner(std::chrono::seconds(cfg.command_timeout_seconds));
        AuditContext context(config(), runner);
        ReportAssembler assembler;
        assembler.register_all_default();
        auto path = assembler.run(context);
        if(!path) Logger::instance().error("CRITICAL: security report could not be saved");
        Logger::instance().info("--- Audit complete ---");
    } catch(const std::exception& ex) {
        Logger::instance().error(std::string("Unhandled error: ") + ex.what());
        return 1;
    }
    return 0;
}
