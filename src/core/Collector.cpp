#include "Collector.h"

namespace host_audit {

std::optional<ReportSection> text_section(const CommandResult& result, const std::string& header, const std::string& none_found){
    if(!result.ok()) return std::nullopt;
    ReportSection s;
    s.header = header;
    s.body = result.output().empty() ? none_found : result.output();
    return s;
}

}
