#include "sandbox/sandbox_executor.hpp"

#include <boost/filesystem.hpp>
#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <set>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace playrun::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr std::size_t kPromptWindow = 8192;
constexpr const char* kTimeoutExplanation = "Job terminated due to timeout";

class PtyPair {
public:
    PtyPair() {
        if (::openpty(&master_, &slave_, nullptr, nullptr, nullptr) != 0) {
            const int err = errno;
            throw SpawnError(std::string("openpty failed: ") + std::strerror(err));
        }
        ::fcntl(master_, F_SETFD, FD_CLOEXEC);
    }

    PtyPair(const PtyPair&) = delete;
    PtyPair& operator=(const PtyPair&) = delete;

    ~PtyPair() {
        CloseSlave();
        if (master_ >= 0) {
            ::close(master_);
        }
    }

    int master() const { return master_; }
    int slave() const { return slave_; }

    void CloseSlave() {
        if (slave_ >= 0) {
            ::close(slave_);
            slave_ = -1;
        }
    }

private:
    int master_ = -1;
    int slave_ = -1;
};

struct CompiledPrompt {
    std::regex pattern;
    std::string key;
};

std::vector<CompiledPrompt> CompilePrompts(const jobs::PasswordPromptMap& passwords) {
    std::vector<CompiledPrompt> compiled;
    compiled.reserve(passwords.prompts.size());
    for (const auto& rule : passwords.prompts) {
        try {
            compiled.push_back(CompiledPrompt{std::regex(rule.pattern + "\\s*$"), rule.key});
        } catch (const std::regex_error& ex) {
            throw SpawnError("invalid prompt pattern '" + rule.pattern + "': " + ex.what());
        }
    }
    return compiled;
}

boost::filesystem::path ResolveExecutable(const std::string& name, const utils::EnvMap& env) {
    if (name.find('/') != std::string::npos) {
        return boost::filesystem::path(name);
    }
    std::string search = "/usr/local/bin:/usr/bin:/bin";
    const auto it = env.find("PATH");
    if (it != env.end() && !it->second.empty()) {
        search = it->second;
    } else if (const char* own = std::getenv("PATH")) {
        search = own;
    }
    std::vector<boost::filesystem::path> dirs;
    for (const auto& dir : utils::SplitCsv(utils::ReplaceAll(search, ":", ","))) {
        dirs.emplace_back(dir);
    }
    return bp::search_path(name, dirs);
}

void WriteAnswer(int fd, const std::string& text) {
    std::size_t offset = 0;
    while (offset < text.size()) {
        const auto written = ::write(fd, text.data() + offset, text.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            utils::LogWarn("runner", std::string("failed to answer prompt: ") + std::strerror(errno));
            return;
        }
        offset += static_cast<std::size_t>(written);
    }
}

class PromptResponder {
public:
    PromptResponder(const jobs::PasswordPromptMap& passwords, int master)
        : passwords_(passwords), prompts_(CompilePrompts(passwords)), master_(master) {}

    void Feed(const std::string& chunk) {
        pending_ += chunk;
        if (pending_.size() > kPromptWindow) {
            pending_.erase(0, pending_.size() - kPromptWindow);
        }
        for (const auto& prompt : prompts_) {
            if (answered_.count(prompt.key) > 0) {
                continue;
            }
            if (!std::regex_search(pending_, prompt.pattern)) {
                continue;
            }
            utils::LogDebug("runner", "answering prompt for " + (prompt.key.empty() ? "<blank>" : prompt.key));
            WriteAnswer(master_, passwords_.Get(prompt.key) + "\n");
            answered_.insert(prompt.key);
            pending_.clear();
            return;
        }
    }

private:
    const jobs::PasswordPromptMap& passwords_;
    std::vector<CompiledPrompt> prompts_;
    int master_;
    std::set<std::string> answered_;
    std::string pending_;
};

// Reads whatever is available within the timeout. Returns false once the pty is closed.
bool PumpOutput(int master, int timeout_ms, const jobs::OutputSink& sink, PromptResponder& responder) {
    pollfd pfd{};
    pfd.fd = master;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
        return errno == EINTR;
    }
    if (rc == 0) {
        return true;
    }
    char buffer[kReadChunk];
    const auto n = ::read(master, buffer, sizeof(buffer));
    if (n > 0) {
        const std::string chunk(buffer, static_cast<std::size_t>(n));
        if (sink) {
            sink(chunk);
        }
        responder.Feed(chunk);
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

void DrainOutput(int master, const jobs::OutputSink& sink, PromptResponder& responder) {
    while (true) {
        pollfd pfd{};
        pfd.fd = master;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, 0) <= 0) {
            return;
        }
        if (!PumpOutput(master, 0, sink, responder)) {
            return;
        }
    }
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

PtyProcessRunner::PtyProcessRunner(const config::RunnerConfig& config, CancelProbe cancel_probe)
    : poll_interval_(config.poll_interval_ms),
      termination_grace_(config.termination_grace_s),
      cancel_probe_(std::move(cancel_probe)) {}

int PtyProcessRunner::Terminate(int pid) const {
    int status = 0;
    ::kill(-pid, SIGTERM);
    const auto grace_deadline = std::chrono::steady_clock::now() + termination_grace_;
    while (std::chrono::steady_clock::now() < grace_deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return DecodeWaitStatus(status);
        }
        if (waited < 0) {
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    utils::LogWarn("runner", "process group " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
    ::kill(-pid, SIGKILL);
    if (::waitpid(pid, &status, 0) == pid) {
        return DecodeWaitStatus(status);
    }
    return -1;
}

RunOutcome PtyProcessRunner::Run(const jobs::UnifiedJob& job,
                                 const std::vector<std::string>& args,
                                 const std::string& cwd,
                                 const utils::EnvMap& env,
                                 const jobs::PasswordPromptMap& passwords,
                                 const jobs::OutputSink& sink) {
    if (args.empty()) {
        throw SpawnError("empty command line");
    }
    const auto exe = ResolveExecutable(args.front(), env);
    if (exe.empty()) {
        throw SpawnError("executable not found: " + args.front());
    }

    PtyPair pty;
    PromptResponder responder(passwords, pty.master());

    bp::environment child_env;
    for (const auto& [key, value] : env) {
        child_env[key] = value;
    }
    const std::vector<std::string> child_args(args.begin() + 1, args.end());
    const int master = pty.master();
    const int slave = pty.slave();

    RunOutcome outcome{};
    try {
        bp::child child_process(
            bp::exe = exe.string(),
            bp::args = child_args,
            child_env,
            bp::start_dir = cwd,
            bp::extend::on_exec_setup([master, slave](auto&) {
                if (::setsid() < 0 || ::ioctl(slave, TIOCSCTTY, 0) < 0) {
                    ::_exit(127);
                }
                if (::dup2(slave, STDIN_FILENO) < 0 || ::dup2(slave, STDOUT_FILENO) < 0 ||
                    ::dup2(slave, STDERR_FILENO) < 0) {
                    ::_exit(127);
                }
                if (slave > STDERR_FILENO) {
                    ::close(slave);
                }
                ::close(master);
            }));
        pty.CloseSlave();

        const pid_t pid = child_process.id();
        utils::LogInfo("runner", "job " + std::to_string(job.id) + " started pid " + std::to_string(pid));
        const auto poll_ms = static_cast<int>(poll_interval_.count());
        const bool has_deadline = job.timeout > 0;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(job.timeout);

        bool output_open = true;
        int status = 0;
        while (true) {
            if (output_open) {
                output_open = PumpOutput(master, poll_ms, sink, responder);
            } else {
                std::this_thread::sleep_for(poll_interval_);
            }
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid || waited < 0) {
                if (output_open) {
                    DrainOutput(master, sink, responder);
                }
                outcome.exit_code = waited == pid ? DecodeWaitStatus(status) : -1;
                outcome.status = outcome.exit_code == 0 ? jobs::JobStatus::kSuccessful : jobs::JobStatus::kFailed;
                break;
            }
            if (cancel_probe_ && cancel_probe_(job.id)) {
                utils::LogInfo("runner", "job " + std::to_string(job.id) + " canceled, terminating");
                outcome.exit_code = Terminate(pid);
                outcome.status = jobs::JobStatus::kCanceled;
                break;
            }
            if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
                utils::LogWarn("runner", "job " + std::to_string(job.id) + " exceeded timeout of " +
                                             std::to_string(job.timeout) + "s");
                outcome.exit_code = Terminate(pid);
                outcome.status = jobs::JobStatus::kFailed;
                outcome.explanation = kTimeoutExplanation;
                break;
            }
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        throw SpawnError(std::string("failed to start ") + args.front() + ": " + ex.what());
    }
    return outcome;
}

}  // namespace playrun::sandbox
