#include "Utils.h"
#include <sstream>
#include <ctime>

namespace host_audit {
namespace utils {

std::string trim_right(const std::string& s){
    size_t end = s.find_last_not_of(" \t\r\n\f\v");
    if(end == std::string::npos) return std::string();
    return s.substr(0, end + 1);
}

std::vector<std::string> split_whitespace(const std::string& s){
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while(iss >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split_lines(const std::string& s){
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string line;
    while(std::getline(iss, line)){
        if(!line.empty() && line.back()=='\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

std::string join_args(const std::vector<std::string>& argv){
    std::string out;
    for(size_t i=0;i<argv.size();++i){ if(i) out.push_back(' '); out += argv[i]; }
    return out;
}

std::string format_local_time(std::chrono::system_clock::time_point tp, const char* fmt){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace utils
} // namespace host_audit
