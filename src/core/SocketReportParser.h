#pragma once
#include <string>
#include <vector>

namespace host_audit {

struct ListeningSocket {
    std::string local_address_port;
    std::string process_name; // "N/A" when the descriptor carries no quoted name
};

// Tolerant record parser for `ss -l -n -p` style output. The first line is the
// column header; each following line is one whitespace separated record.
class SocketReportParser {
public:
    static constexpr const char* kUnknownProcess = "N/A";
    static constexpr size_t kMinFields = 5;

    static std::vector<ListeningSocket> parse(const std::string& raw);

    // users:(("sshd",pid=1,fd=3)) -> sshd. Anything without a quote -> "N/A".
    static std::string process_name_from_descriptor(const std::string& descriptor);

    // Column shift for the record layout announced by the header line:
    // 0 with a leading Netid column (or an unrecognized header), 1 when the
    // header starts at State because ss listed a single socket family.
    static size_t column_shift(const std::string& header_line);
};

}
