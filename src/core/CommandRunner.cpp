#include "CommandRunner.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace host_audit {

CommandResult CommandRunner::run(const std::vector<std::string>& argv, const RunOptions& opts){
    auto timeout = opts.timeout.count() > 0 ? opts.timeout : default_timeout_;
    Logger::instance().trace("exec: " + utils::join_args(argv));
    CommandResult result = [&]{
        try {
            return execute(argv, timeout);
        } catch(const std::exception& ex) {
            Logger::instance().debug(std::string("command launch raised: ") + ex.what());
            return CommandResult::failed(make_not_found(argv));
        }
    }();
    if(!result.ok() && !opts.suppress_error_output) Logger::instance().error(describe(result.failure()));
    return result;
}

std::string describe(const CommandFailure& failure){
    switch(failure.kind){
        case FailureKind::NotFound:
            return "Command not found: '" + failure.detail + "'";
        case FailureKind::Timeout:
            return "Command timed out: '" + failure.detail + "'";
        case FailureKind::NonZeroExit: {
            std::string msg = "Error executing command: '" + failure.detail + "'";
            if(failure.signal) msg += " (killed by signal " + std::to_string(failure.signal) + ")";
            else msg += " (exit status " + std::to_string(failure.exit_code) + ")";
            if(!failure.stderr_text.empty()) msg += "; stderr: " + failure.stderr_text;
            return msg;
        }
    }
    return "Command failed: '" + failure.detail + "'";
}

namespace {

struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f): fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd(){ reset(); }
    void reset(){ if(fd >= 0){ ::close(fd); fd = -1; } }
};

bool make_pipe(Fd& rd, Fd& wr){
    int p[2];
    if(pipe2(p, O_CLOEXEC) != 0) return false;
    rd.fd = p[0]; wr.fd = p[1];
    return true;
}

// Returns false on EOF or a hard read error.
bool drain(int fd, std::string& sink){
    char buf[4096];
    while(true){
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if(n > 0){
            size_t room = sink.size() < ProcessCommandRunner::kMaxCapture ? ProcessCommandRunner::kMaxCapture - sink.size() : 0;
            sink.append(buf, std::min(room, static_cast<size_t>(n)));
            return true;
        }
        if(n == 0) return false;
        if(errno == EINTR) continue;
        return errno == EAGAIN;
    }
}

} // namespace

void ChildGuard::kill_and_reap(){
    if(pid_ <= 0) return;
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    int status = 0;
    while(::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    pid_ = -1;
}

CommandResult ProcessCommandRunner::execute(const std::vector<std::string>& argv, std::chrono::milliseconds timeout){
    if(argv.empty() || argv[0].empty()) return CommandResult::failed(make_not_found(argv));

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Fd out_rd, out_wr, err_rd, err_wr, exec_rd, exec_wr;
    if(!make_pipe(out_rd, out_wr) || !make_pipe(err_rd, err_wr) || !make_pipe(exec_rd, exec_wr)){
        Logger::instance().debug(std::string("pipe2 failed: ") + std::strerror(errno));
        return CommandResult::failed(make_not_found(argv));
    }

    pid_t pid = ::fork();
    if(pid < 0){
        Logger::instance().debug(std::string("fork failed: ") + std::strerror(errno));
        return CommandResult::failed(make_not_found(argv));
    }
    if(pid == 0){
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if(devnull >= 0){ ::dup2(devnull, STDIN_FILENO); ::close(devnull); }
        ::dup2(out_wr.fd, STDOUT_FILENO);
        ::dup2(err_wr.fd, STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t w = ::write(exec_wr.fd, &e, sizeof(e));
        (void)w;
        _exit(127);
    }
    ChildGuard child(pid);
    ::setpgid(pid, pid); // also done in the child; whichever runs first wins
    out_wr.reset(); err_wr.reset(); exec_wr.reset();

    // exec_rd reaches EOF once execvp succeeds (CLOEXEC), or carries errno if it failed
    int exec_errno = 0;
    ssize_t got;
    while((got = ::read(exec_rd.fd, &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    if(got == static_cast<ssize_t>(sizeof(exec_errno))){
        int status = 0;
        while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        child.release();
        Logger::instance().debug("execvp(" + argv[0] + ") failed: " + std::strerror(exec_errno));
        return CommandResult::failed(make_not_found(argv));
    }

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    auto remaining_ms = [&]{
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    };

    std::string out, err;
    bool out_open = true, err_open = true, timed_out = false;
    while(out_open || err_open){
        long long left = remaining_ms();
        if(left <= 0){ timed_out = true; break; }
        pollfd fds[2]; nfds_t n = 0;
        if(out_open) fds[n++] = pollfd{out_rd.fd, POLLIN, 0};
        if(err_open) fds[n++] = pollfd{err_rd.fd, POLLIN, 0};
        int rc = ::poll(fds, n, static_cast<int>(std::min<long long>(left, 100)));
        if(rc < 0){
            if(errno == EINTR) continue;
            Logger::instance().debug(std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        for(nfds_t i=0;i<n;++i){
            if(!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if(fds[i].fd == out_rd.fd){ if(!drain(out_rd.fd, out)) out_open = false; }
            else { if(!drain(err_rd.fd, err)) err_open = false; }
        }
    }

    int status = 0;
    bool reaped = false;
    while(!timed_out){
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if(r == pid){ reaped = true; child.release(); break; }
        if(r < 0 && errno != EINTR) break;
        if(remaining_ms() <= 0){ timed_out = true; break; }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if(timed_out){
        child.kill_and_reap();
        return CommandResult::failed(make_timeout(argv));
    }
    if(!reaped){
        child.kill_and_reap();
        return CommandResult::failed(make_non_zero_exit(argv, err, -1));
    }
    if(WIFEXITED(status) && WEXITSTATUS(status) == 0) return CommandResult::success(utils::trim_right(out));
    if(WIFSIGNALED(status)) return CommandResult::failed(make_non_zero_exit(argv, err, -1, WTERMSIG(status)));
    return CommandResult::failed(make_non_zero_exit(argv, err, WEXITSTATUS(status)));
}

}
