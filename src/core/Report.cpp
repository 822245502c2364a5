#include "Report.h"
#include "Utils.h"
#include <sstream>

namespace host_audit {

std::string Report::render() const {
    std::ostringstream os;
    os << title_ << "\n";
    os << "Generated on: " << utils::format_local_time(generated_at_, "%Y-%m-%d %H:%M:%S") << "\n";
    os << std::string(kRuleWidth, '=') << "\n";
    for(const auto& s : sections_){
        os << "\n" << s.header << "\n" << s.body << "\n";
    }
    return os.str();
}

}
