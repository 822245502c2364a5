#pragma once
#include "Report.h"
#include <optional>
#include <string>

namespace host_audit {

struct Config;

class ReportWriter {
public:
    explicit ReportWriter(const Config& cfg): cfg_(cfg) {}

    // Writes report.render() to <output_dir>/<prefix><YYYY-MM-DD_HH-MM-SS>.txt.
    // An existing file is never overwritten: _1, _2, ... is appended instead.
    // Returns the written path, or nullopt after logging the failure.
    std::optional<std::string> write(const Report& report) const;

    std::string base_name(const Report& report) const;
private:
    std::string next_free_path(const std::string& base) const;
    const Config& cfg_;
};

// Hex SHA-256 of data; empty when built without OpenSSL.
std::string sha256_hex(const std::string& data);

}
