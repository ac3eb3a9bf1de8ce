#include "runtime/execution.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static atomic<size_t> spawned_processes{0};

static const size_t BUF_SIZE = 1 << 16;

/**
 * @brief 子进程退出后继续读取管道的最长时间
 * 逃出进程组的后代进程可能一直持有管道
 */
static const chrono::milliseconds DRAIN_TIMEOUT(200);

/**
 * @brief 轮询子进程状态的最大间隔，决定超时后杀死子进程的延迟
 */
static const chrono::milliseconds POLL_INTERVAL(20);

enum child_stage {
    STAGE_DUP = 1,
    STAGE_CHDIR = 2,
    STAGE_EXEC = 3
};

void cancellation_token::cancel() noexcept {
    flag.store(true);
}

bool cancellation_token::cancelled() const noexcept {
    return flag.load();
}

execution_request::execution_request()
    : time_limit(DEFAULT_TIME_LIMIT), output_limit(DEFAULT_OUTPUT_LIMIT) {}

size_t spawned_process_count() {
    return spawned_processes.load();
}

map<string, string> scrubbed_environment(const map<string, string> &extra) {
    map<string, string> env;
    for (auto &key : ENV_ALLOW_LIST) {
        const char *value = getenv(key.c_str());
        if (value) env[key] = value;
    }
    env["PATH"] = toolchain_search_path();
    for (auto &[key, value] : extra)
        env[key] = value;
    return env;
}

[[noreturn]] static void report_child_error(int error_fd, int stage) {
    int payload[2] = {stage, errno};
    ssize_t ignored = write(error_fd, payload, sizeof(payload));
    (void)ignored;
    _exit(127);
}

/**
 * @brief fork 之后在子进程中执行，只能调用 async-signal-safe 的函数
 */
[[noreturn]] static void exec_child(const char *path, char *const argv[], char *const envp[], const char *work_dir,
                                    int stdin_fd, int stdout_fd, int stderr_fd, int error_fd) {
    // 独立的进程组，便于一次杀死学生程序创建的所有进程
    setpgid(0, 0);

    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);

    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0)
        report_child_error(error_fd, STAGE_DUP);

    if (chdir(work_dir) != 0)
        report_child_error(error_fd, STAGE_CHDIR);

    struct rlimit core = {0, 0};
    setrlimit(RLIMIT_CORE, &core);
    struct rlimit fsize = {(rlim_t)FILE_SIZE_LIMIT, (rlim_t)FILE_SIZE_LIMIT};
    setrlimit(RLIMIT_FSIZE, &fsize);

    execve(path, argv, envp);
    report_child_error(error_fd, STAGE_EXEC);
}

static const char *stage_name(int stage) {
    switch (stage) {
        case STAGE_DUP:
            return "redirecting standard streams";
        case STAGE_CHDIR:
            return "changing working directory";
        default:
            return "executing command";
    }
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

execution_result run_process(const execution_request &request, const cancellation_token *token) {
    execution_result result;
    auto fail = [&](const string &message) {
        result.state = run_state::SYSTEM_ERROR;
        result.system_error = message;
        LOG(ERROR) << "Unable to run " << (request.argv.empty() ? string() : request.argv[0]) << ": " << message;
        return result;
    };

    if (request.argv.empty())
        return fail("empty command");

    map<string, string> env = scrubbed_environment(request.env);

    string program = request.argv[0];
    if (program.find('/') == string::npos) {
        auto found = find_executable(program, env["PATH"]);
        if (!found) return fail("command not found: " + program);
        program = found->string();
    }

    // argv 和 envp 必须在 fork 之前准备好，子进程中不能分配内存
    vector<string> env_strings;
    for (auto &[key, value] : env)
        env_strings.push_back(key + "=" + value);
    vector<char *> argv, envp;
    for (auto &arg : request.argv)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &entry : env_strings)
        envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);
    string work_dir = request.work_dir.empty() ? string(".") : request.work_dir.string();

    int stdin_fd = -1;
    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, error_pipe[2] = {-1, -1};
    defer {
        close_fd(stdin_fd);
        for (int *fd_pair : {out_pipe, err_pipe, error_pipe}) {
            close_fd(fd_pair[0]);
            close_fd(fd_pair[1]);
        }
    };

    string stdin_path = request.stdin_file.empty() ? string("/dev/null") : request.stdin_file.string();
    stdin_fd = open(stdin_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd < 0)
        return fail(fmt::format("unable to open stdin file {}: {}", stdin_path, strerror(errno)));

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(error_pipe, O_CLOEXEC) != 0)
        return fail(fmt::format("unable to create pipes: {}", strerror(errno)));

    DLOG(INFO) << "Running [" << boost::algorithm::join(request.argv, " ") << "] in " << work_dir;

    auto start = chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0)
        return fail(fmt::format("unable to fork: {}", strerror(errno)));
    if (pid == 0)
        exec_child(program.c_str(), argv.data(), envp.data(), work_dir.c_str(),
                   stdin_fd, out_pipe[1], err_pipe[1], error_pipe[1]);

    ++spawned_processes;
    // 父子进程都设置进程组，避免父进程发送信号时子进程还没有调用 setpgid
    setpgid(pid, pid);
    result.state = run_state::RUNNING;

    close_fd(stdin_fd);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(error_pipe[1]);

    // execve 成功时 error_pipe 因为 O_CLOEXEC 被关闭，读到 EOF
    int payload[2] = {0, 0};
    ssize_t nread;
    do {
        nread = read(error_pipe[0], payload, sizeof(payload));
    } while (nread < 0 && errno == EINTR);
    if (nread == (ssize_t)sizeof(payload)) {
        int status;
        waitpid(pid, &status, 0);
        return fail(fmt::format("{} failed: {}", stage_name(payload[0]), strerror(payload[1])));
    }

    double time_limit = min(request.time_limit, MAX_TIME_LIMIT);
    auto deadline = start + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(time_limit));
    auto kill_delay = chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(KILL_DELAY));
    optional<chrono::steady_clock::time_point> term_sent, kill_sent;
    chrono::steady_clock::time_point drain_deadline;
    bool reaped = false, timed_out = false, cancelled = false;
    int status = 0;

    int fds[2] = {out_pipe[0], err_pipe[0]};
    string *buffers[2] = {&result.output, &result.error};
    vector<char> buf(BUF_SIZE);

    while (true) {
        if (!reaped) {
            siginfo_t info;
            info.si_pid = 0;
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
                // 子进程还没有被回收，进程组 id 不会被复用，此时清理残留的后代进程
                kill(-pid, SIGKILL);
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                    ;
                reaped = true;
                result.duration = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start);
                drain_deadline = chrono::steady_clock::now() + DRAIN_TIMEOUT;
            }
        }

        auto now = chrono::steady_clock::now();
        if (!reaped) {
            if (!term_sent) {
                if (token && token->cancelled()) {
                    cancelled = true;
                    LOG(INFO) << "Submission cancelled, terminating process group " << pid;
                } else if (now >= deadline) {
                    timed_out = true;
                    LOG(INFO) << "Time limit " << time_limit << "s exceeded, terminating process group " << pid;
                }
                if (cancelled || timed_out) {
                    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
                        LOG(ERROR) << "Unable to send SIGTERM to process group " << pid << ": " << strerror(errno);
                    term_sent = now;
                }
            } else if (!kill_sent && now >= *term_sent + kill_delay) {
                if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
                    LOG(ERROR) << "Unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
                kill_sent = now;
            }
        }

        bool pipes_open = fds[0] >= 0 || fds[1] >= 0;
        if (reaped && (!pipes_open || now >= drain_deadline))
            break;

        chrono::milliseconds interval = POLL_INTERVAL;
        if (!reaped && !term_sent && deadline > now)
            interval = min(interval, chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1));

        if (!pipes_open) {
            this_thread::sleep_for(interval);
            continue;
        }

        pollfd pfds[2];
        int index[2];
        nfds_t count = 0;
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[count] = pollfd{fds[i], POLLIN, 0};
            index[count++] = i;
        }

        int ready = poll(pfds, count, (int)interval.count());
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG(ERROR) << "Unable to poll output of process " << pid << ": " << strerror(errno);
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            fds[0] = fds[1] = -1;
            continue;
        }

        for (nfds_t k = 0; k < count; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = index[k];
            ssize_t n = read(fds[i], buf.data(), buf.size());
            if (n > 0) {
                string &target = *buffers[i];
                size_t room = target.size() < request.output_limit ? request.output_limit - target.size() : 0;
                // 超出限制的部分读出后直接丢弃
                target.append(buf.data(), min(room, (size_t)n));
                if ((size_t)n > room) result.truncated = true;
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(i == 0 ? out_pipe[0] : err_pipe[0]);
                fds[i] = -1;
            }
        }
    }

    if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    if (cancelled)
        result.state = run_state::CANCELLED;
    else if (timed_out)
        result.state = run_state::TIMED_OUT;
    else if (result.signal != 0)
        result.state = run_state::CRASHED;
    else if (result.exit_code != 0 && request.expect_clean_exit)
        result.state = run_state::CRASHED;
    else if (result.truncated)
        result.state = run_state::OUTPUT_TRUNCATED;
    else
        result.state = run_state::COMPLETED;

    DLOG(INFO) << "Process " << pid << " finished: " << get_display_message(result.state)
               << ", exit code " << result.exit_code << ", " << result.duration.count() << "ms";
    return result;
}

}  // namespace grader
