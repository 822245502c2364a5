#include "SocketReportParser.h"
#include "Utils.h"

namespace host_audit {

static const size_t kLocalAddressField = 4;
static const size_t kProcessField = 6;

size_t SocketReportParser::column_shift(const std::string& header_line){
    auto cols = utils::split_whitespace(header_line);
    if(!cols.empty() && cols[0] == "State") return 1;
    return 0;
}

std::string SocketReportParser::process_name_from_descriptor(const std::string& descriptor){
    size_t open = descriptor.find('"');
    if(open == std::string::npos) return kUnknownProcess;
    size_t close = descriptor.find('"', open + 1);
    std::string name = close == std::string::npos ? descriptor.substr(open + 1) : descriptor.substr(open + 1, close - open - 1);
    if(name.empty()) return kUnknownProcess;
    return name;
}

std::vector<ListeningSocket> SocketReportParser::parse(const std::string& raw){
    std::vector<ListeningSocket> out;
    auto lines = utils::split_lines(raw);
    if(lines.size() < 2) return out; // empty or header only

    const size_t shift = column_shift(lines[0]);
    const size_t addr_idx = kLocalAddressField - shift;
    const size_t proc_idx = kProcessField - shift;

    for(size_t i=1;i<lines.size();++i){
        auto fields = utils::split_whitespace(lines[i]);
        if(fields.size() < kMinFields) continue; // truncated record
        ListeningSocket s;
        s.local_address_port = fields[addr_idx];
        s.process_name = proc_idx < fields.size() ? process_name_from_descriptor(fields[proc_idx]) : kUnknownProcess;
        out.push_back(std::move(s));
    }
    return out;
}

}
