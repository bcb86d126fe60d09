#include "localjudge/run/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <system_error>
#include "localjudge/common/io_utils.hpp"
#include "localjudge/common/utils.hpp"

namespace localjudge {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 管道仍然打开时，每隔这么久检查一次子进程是否已经结束
const int WAIT_INTERVAL_MS = 50;

// 子进程结束后，最多等待这么久来读取管道内剩余的数据
const int DRAIN_TIMEOUT_MS = 100;

template <typename... Args>
[[noreturn]] static void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

namespace {

struct scoped_fd {
    int fd = -1;

    scoped_fd() = default;
    scoped_fd(const scoped_fd &) = delete;
    scoped_fd &operator=(const scoped_fd &) = delete;

    ~scoped_fd() {
        reset();
    }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
};

}  // namespace

bool process_result::timed_out() const {
    return kind == outcome::TIMEOUT;
}

static void kill_group(pid_t child_pid, int sig) {
    // 进程组内所有进程都已经结束时会返回 ESRCH，这不是错误
    if (kill(-child_pid, sig) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send signal " << sig << " to process group " << child_pid << ": " << strerror(errno);
}

static pid_t wait_child(pid_t child_pid, int &status, int options) {
    pid_t pid;
    while ((pid = waitpid(child_pid, &status, options)) < 0) {
        if (errno != EINTR) error(errno, "waiting on child {}", child_pid);
    }
    return pid;
}

namespace {
/**
 * @brief 出错时杀死子进程所在的进程组并回收子进程
 * 子进程已经被回收后调用 reaped()，处理完毕后调用 release()
 */
struct child_guard {
    pid_t pid;
    bool waited = false;
    bool active = true;

    explicit child_guard(pid_t pid) : pid(pid) {}
    child_guard(const child_guard &) = delete;
    child_guard &operator=(const child_guard &) = delete;

    ~child_guard() {
        if (!active) return;
        LOG(WARNING) << "killing process group " << pid << " after an error";
        kill_group(pid, SIGKILL);
        if (waited) return;
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    }

    void reaped() { waited = true; }
    void release() { active = false; }
};
}  // namespace

/**
 * @brief 读取 poll 返回可读的管道，直到管道暂时没有数据或者遇到 EOF
 * 遇到 EOF 时关闭管道，并将其标记为 -1
 */
static void pump_pipes(struct pollfd fds[], int nfds, scoped_fd child_pipefd[][2], string output[]) {
    char buf[BUF_SIZE];
    for (int k = 0; k < nfds; ++k) {
        if (!(fds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        int i = fds[k].fd == child_pipefd[STDOUT_FILENO][PIPE_OUT].fd ? STDOUT_FILENO : STDERR_FILENO;
        while (true) {
            ssize_t nread = read(child_pipefd[i][PIPE_OUT].fd, buf, BUF_SIZE);
            if (nread > 0) {
                output[i].append(buf, nread);
                continue;
            }
            if (nread == 0) {
                // EOF detected: close fd and indicate this with -1
                child_pipefd[i][PIPE_OUT].reset();
                break;
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            error(errno, "copying data fd {}", i);
        }
    }
}

static int collect_pollfds(struct pollfd fds[], scoped_fd child_pipefd[][2]) {
    int nfds = 0;
    for (int i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT].fd >= 0) {
            fds[nfds].fd = child_pipefd[i][PIPE_OUT].fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            ++nfds;
        }
    }
    return nfds;
}

process_result run_process(const process_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("command to run should not be empty");

    string stdin_filename = opt.stdin_filename.empty() ? "/dev/null" : opt.stdin_filename.string();
    scoped_fd stdin_fd;
    stdin_fd.fd = open(stdin_filename.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd.fd < 0) error(errno, "opening file '{}'", stdin_filename);

    // 0 号管道用于子进程在 exec 失败时回报 errno，1、2 号管道连接子进程的 stdout、stderr
    scoped_fd child_pipefd[3][2];
    for (int i = 0; i <= 2; i++) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
        child_pipefd[i][PIPE_OUT].fd = fds[0];
        child_pipefd[i][PIPE_IN].fd = fds[1];
    }

    // fork 之后子进程内不能再分配内存，所以参数提前准备好
    vector<char *> args;
    for (const string &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    elapsed_time timer;
    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // child process, run the command
            // 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
            setpgid(0, 0);
            if (dup2(stdin_fd.fd, STDIN_FILENO) >= 0 &&
                dup2(child_pipefd[STDOUT_FILENO][PIPE_IN].fd, STDOUT_FILENO) >= 0 &&
                dup2(child_pipefd[STDERR_FILENO][PIPE_IN].fd, STDERR_FILENO) >= 0) {
                execvp(args[0], args.data());
            }
            int err = errno;
            if (write(child_pipefd[0][PIPE_IN].fd, &err, sizeof(err)) != sizeof(err))
                _exit(126);
            _exit(127);
        }
        default:
            break;
    }

    // 父进程也设置一次，避免在子进程 setpgid 之前就发送信号
    setpgid(child_pid, child_pid);
    child_guard guard(child_pid);

    stdin_fd.reset();
    for (int i = 0; i <= 2; i++) child_pipefd[i][PIPE_IN].reset();

    {
        // exec 成功时管道因为 O_CLOEXEC 被关闭，这里读到 EOF
        int exec_errno = 0;
        ssize_t nread;
        while ((nread = read(child_pipefd[0][PIPE_OUT].fd, &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR)
            ;
        child_pipefd[0][PIPE_OUT].reset();
        if (nread == sizeof(exec_errno)) {
            int status = 0;
            wait_child(child_pid, status, 0);
            guard.reaped();
            error(exec_errno, "unable to start command {}", opt.command[0]);
        }
    }

    for (int i = 1; i <= 2; i++) {
        int flags = fcntl(child_pipefd[i][PIPE_OUT].fd, F_GETFL);
        if (flags == -1 || fcntl(child_pipefd[i][PIPE_OUT].fd, F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "fcntl, setting flags for fd {}", i);
    }

    optional<chrono::steady_clock::time_point> deadline;
    if (opt.wall_limit) {
        deadline = chrono::steady_clock::now() +
                   chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(*opt.wall_limit));
        LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", *opt.wall_limit);
    }

    string output[3];
    struct pollfd fds[2];
    int status = 0;
    bool timed_out = false;
    while (true) {
        if (wait_child(child_pid, status, WNOHANG) == child_pid) {
            guard.reaped();
            break;
        }

        int nfds = collect_pollfds(fds, child_pipefd);
        // 管道都已经关闭时只需要等待子进程结束，缩短检查间隔以免影响计时
        int timeout_ms = nfds > 0 ? WAIT_INTERVAL_MS : 1;
        if (deadline) {
            auto remaining = *deadline - chrono::steady_clock::now();
            if (remaining <= chrono::steady_clock::duration::zero()) {
                timed_out = true;
                break;
            }
            auto remaining_ms = chrono::duration_cast<chrono::milliseconds>(remaining).count() + 1;
            timeout_ms = (int)min<long long>(timeout_ms, remaining_ms);
        }

        int r = poll(fds, nfds, timeout_ms);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
        if (r > 0) pump_pipes(fds, nfds, child_pipefd, output);
    }

    if (timed_out) {
        LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";

        // 先尝试让进程自行退出，再强制杀死
        kill_group(child_pid, SIGTERM);
        nanosleep(&killdelay, nullptr);
        kill_group(child_pid, SIGKILL);
        wait_child(child_pid, status, 0);
        guard.reaped();
    } else {
        // 杀死进程组内残留的进程，确保选手 fork 出来的子进程都不会留驻系统
        kill_group(child_pid, SIGKILL);
    }
    double wall_time = timer.seconds();

    while (true) {
        int nfds = collect_pollfds(fds, child_pipefd);
        if (nfds == 0) break;
        int r = poll(fds, nfds, DRAIN_TIMEOUT_MS);
        if (r == -1 && errno == EINTR) continue;
        if (r == -1) error(errno, "waiting for child data");
        if (r == 0) {
            LOG(WARNING) << "output pipes of command " << opt.command[0] << " are still open, giving up";
            break;
        }
        pump_pipes(fds, nfds, child_pipefd, output);
    }

    process_result result;
    result.wall_time = wall_time;
    result.stdout_text = sanitize_utf8(output[STDOUT_FILENO]);
    result.stderr_text = sanitize_utf8(output[STDERR_FILENO]);

    if (timed_out) {
        result.kind = process_result::outcome::TIMEOUT;
        if (WIFSIGNALED(status)) result.signal = WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        result.kind = process_result::outcome::EXITED;
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.kind = process_result::outcome::SIGNALED;
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    guard.release();
    return result;
}

}  // namespace localjudge
