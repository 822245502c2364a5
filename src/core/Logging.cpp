#include "Logging.h"
#include <iostream>

namespace host_audit {

Logger& Logger::instance(){
    static Logger logger;
    return logger;
}

const char* Logger::prefix(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "[ERROR] ";
        case LogLevel::Warn: return "[WARN] ";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Debug: return "[DEBUG] ";
        case LogLevel::Trace: return "[TRACE] ";
    }
    return "";
}

void Logger::log(LogLevel lvl, const std::string& msg){
    if(static_cast<int>(lvl) > static_cast<int>(level_.load())) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << prefix(lvl) << msg << '\n';
    std::cerr.flush();
}

const char* log_level_name(LogLevel lvl){
    switch(lvl){
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "unknown";
}

}
