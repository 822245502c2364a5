#include "ConfigValidator.h"
#include "Logging.h"

namespace host_audit {

bool ConfigValidator::require_positive(int value, const char* field){
    if(value > 0) return true;
    errors_.push_back(std::string(field) + " must be positive (got " + std::to_string(value) + ")");
    return false;
}

bool ConfigValidator::validate(Config& cfg){
    errors_.clear();
    bool ok = true;
    ok = require_positive(cfg.command_timeout_seconds, "command_timeout_seconds") && ok;
    ok = require_positive(cfg.metadata_connect_timeout_seconds, "metadata_connect_timeout_seconds") && ok;
    ok = require_positive(cfg.metadata_max_time_seconds, "metadata_max_time_seconds") && ok;
    ok = require_positive(cfg.last_login_count, "last_login_count") && ok;

    // The metadata probe is expected to fail fast on non-cloud hosts
    if(cfg.metadata_connect_timeout_seconds > 1){
        Logger::instance().debug("Clamping metadata connect timeout to 1s");
        cfg.metadata_connect_timeout_seconds = 1;
    }
    if(cfg.metadata_max_time_seconds < cfg.metadata_connect_timeout_seconds){
        cfg.metadata_max_time_seconds = cfg.metadata_connect_timeout_seconds;
    }
    if(cfg.metadata_url.empty()){
        errors_.push_back("metadata_url must not be empty");
        ok = false;
    }
    if(cfg.report_prefix.empty()){
        errors_.push_back("report_prefix must not be empty");
        ok = false;
    } else if(cfg.report_prefix.find('/') != std::string::npos){
        errors_.push_back("report_prefix must not contain '/'");
        ok = false;
    }
    if(cfg.output_dir.empty()) cfg.output_dir = ".";
    return ok;
}

}
