#pragma once
#include <string>
#include <vector>
#include <optional>

namespace host_audit {

enum class FailureKind { NotFound, NonZeroExit, Timeout };

const char* failure_kind_name(FailureKind kind);

struct CommandFailure {
    FailureKind kind = FailureKind::NotFound;
    std::string detail; // argv[0] for NotFound, full command line otherwise
    std::vector<std::string> argv;
    std::string stderr_text; // NonZeroExit only
    int exit_code = -1; // -1 when the child did not exit normally
    int signal = 0; // terminating signal, 0 if none
};

// Outcome of one external command: captured stdout or a classified failure.
class CommandResult {
public:
    static CommandResult success(std::string output){
        CommandResult r; r.output_ = std::move(output); return r;
    }
    static CommandResult failed(CommandFailure failure){
        CommandResult r; r.failure_ = std::move(failure); return r;
    }

    bool ok() const { return !failure_.has_value(); }
    const std::string& output() const { return output_; }
    const CommandFailure& failure() const { return *failure_; }
private:
    CommandResult() = default;
    std::string output_;
    std::optional<CommandFailure> failure_;
};

CommandFailure make_not_found(const std::vector<std::string>& argv);
CommandFailure make_timeout(const std::vector<std::string>& argv);
CommandFailure make_non_zero_exit(const std::vector<std::string>& argv, std::string stderr_text, int exit_code, int signal = 0);

}
