#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace host_audit {

class ConfigValidator {
public:
    // Normalizes cfg in place. Returns false if a value cannot be used;
    // the reasons are available from errors().
    bool validate(Config& cfg);
    const std::vector<std::string>& errors() const { return errors_; }
private:
    bool require_positive(int value, const char* field);
    std::vector<std::string> errors_;
};

}
