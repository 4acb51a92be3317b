// cpp/dict/opencc_oracle.cpp
#include "opencc_oracle.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>
#include <utility>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "pipeline_error.h"

namespace {

// ==================== pipe helpers ====================

struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

// SIGPIPE ignored while the batch is in flight: a child that exits early
// must surface as EPIPE + exit status, not kill the builder.
class SigpipeGuard {
public:
    SigpipeGuard() {
        struct sigaction ign {};
        ign.sa_handler = SIG_IGN;
        sigemptyset(&ign.sa_mask);
        ok_ = ::sigaction(SIGPIPE, &ign, &old_) == 0;
    }
    ~SigpipeGuard() {
        if (ok_) ::sigaction(SIGPIPE, &old_, nullptr);
    }
private:
    struct sigaction old_ {};
    bool ok_ = false;
};

bool write_all_fd(int fd, const char* p, std::size_t n) {
    while (n > 0) {
        ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += w;
        n -= (std::size_t)w;
    }
    return true;
}

std::string join_batch(const std::vector<std::string>& inputs) {
    std::size_t total = 0;
    for (const auto& s : inputs) total += s.size() + 1;

    std::string buf;
    buf.reserve(total);
    for (const auto& s : inputs) {
        buf += s;
        buf.push_back('\n');
    }
    return buf;
}

} // namespace

std::vector<std::string> split_output_lines(const std::string& out) {
    std::vector<std::string> lines;
    if (out.empty()) return lines;

    std::size_t start = 0;
    while (start < out.size()) {
        std::size_t nl = out.find('\n', start);
        if (nl == std::string::npos) nl = out.size();
        std::string line = out.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = nl + 1;
    }
    return lines;
}

OpenccProcessOracle::OpenccProcessOracle(std::string binary, std::string config)
    : binary_(std::move(binary)), config_(std::move(config)) {}

std::vector<std::string> OpenccProcessOracle::convert_batch(const std::vector<std::string>& inputs) {
    if (inputs.empty()) return {};

    const std::string payload = join_batch(inputs);

    int in_pipe[2];
    int out_pipe[2];
    if (::pipe(in_pipe) != 0) {
        throw OracleContractError(std::string("pipe() failed: ") + std::strerror(errno));
    }
    Fd in_r(in_pipe[0]), in_w(in_pipe[1]);
    if (::pipe(out_pipe) != 0) {
        throw OracleContractError(std::string("pipe() failed: ") + std::strerror(errno));
    }
    Fd out_r(out_pipe[0]), out_w(out_pipe[1]);

    SigpipeGuard sigpipe_guard;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw OracleContractError(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // child: stdin <- in_r, stdout -> out_w, stderr inherited
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);

        const char* argv[] = {binary_.c_str(), "-c", config_.c_str(), nullptr};
        ::execvp(argv[0], const_cast<char* const*>(argv));
        ::_exit(127);
    }

    in_r.reset();
    out_w.reset();

    // feed stdin from a second thread so a full stdout pipe cannot deadlock us
    bool write_ok = true;
    std::thread feeder([&]() {
        write_ok = write_all_fd(in_w.fd, payload.data(), payload.size());
        in_w.reset();
    });

    std::string output;
    char buf[1 << 16];
    for (;;) {
        ssize_t r = ::read(out_r.fd, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) break;
        output.append(buf, (std::size_t)r);
    }
    out_r.reset();
    feeder.join();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw OracleContractError(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    if (WIFSIGNALED(status)) {
        throw OracleContractError(binary_ + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        if (code == 127) {
            throw OracleContractError("cannot execute " + binary_);
        }
        throw OracleContractError(binary_ + " exited with status " + std::to_string(code));
    }
    if (!write_ok) {
        throw OracleContractError("short write to " + binary_ + " stdin");
    }

    std::cout << "[opencc_oracle] " << binary_ << " -c " << config_
              << ": in=" << inputs.size() << " bytes_out=" << output.size() << "\n";

    return split_output_lines(output);
}
