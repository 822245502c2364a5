#include "CommandResult.h"
#include "Utils.h"

namespace host_audit {

const char* failure_kind_name(FailureKind kind){
    switch(kind){
        case FailureKind::NotFound: return "not_found";
        case FailureKind::NonZeroExit: return "non_zero_exit";
        case FailureKind::Timeout: return "timeout";
    }
    return "unknown";
}

CommandFailure make_not_found(const std::vector<std::string>& argv){
    CommandFailure f;
    f.kind = FailureKind::NotFound;
    f.detail = argv.empty() ? std::string() : argv[0];
    f.argv = argv;
    return f;
}

CommandFailure make_timeout(const std::vector<std::string>& argv){
    CommandFailure f;
    f.kind = FailureKind::Timeout;
    f.detail = utils::join_args(argv);
    f.argv = argv;
    return f;
}

CommandFailure make_non_zero_exit(const std::vector<std::string>& argv, std::string stderr_text, int exit_code, int signal){
    CommandFailure f;
    f.kind = FailureKind::NonZeroExit;
    f.detail = utils::join_args(argv);
    f.argv = argv;
    f.stderr_text = utils::trim_right(stderr_text);
    f.exit_code = exit_code;
    f.signal = signal;
    return f;
}

}
