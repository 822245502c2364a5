#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace host_audit {

struct ReportSection {
    std::string header;
    std::string body;
};

class Report {
public:
    static constexpr size_t kRuleWidth = 50;

    Report(std::string title, std::chrono::system_clock::time_point generated_at)
        : title_(std::move(title)), generated_at_(generated_at) {}

    void add_section(ReportSection section){ sections_.push_back(std::move(section)); }

    std::chrono::system_clock::time_point generated_at() const { return generated_at_; }
    const std::vector<ReportSection>& sections() const { return sections_; }

    // Title, "Generated on:" line, '=' rule, then each section (header + body)
    // separated by blank lines.
    std::string render() const;
private:
    std::string title_;
    std::chrono::system_clock::time_point generated_at_;
    std::vector<ReportSection> sections_;
};

}
