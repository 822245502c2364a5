#pragma once
#include <string>
#include "Logging.h"

namespace host_audit {

struct Config {
    int command_timeout_seconds = 10; // hard wall-clock bound for every probe command
    std::string metadata_url = "http://169.254.169.254/latest/meta-data/";
    int metadata_connect_timeout_seconds = 1; // must stay <= 1
    int metadata_max_time_seconds = 2;
    int last_login_count = 10;
    std::string output_dir = "."; // report lands in the working directory by default
    std::string report_prefix = "security_report_";
    std::string report_title = "Host Security Audit Report";
    LogLevel log_level = LogLevel::Info;
};

Config& config();
void set_config(const Config& c);

}
