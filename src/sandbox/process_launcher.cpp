#include "sandbox/process_launcher.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>

#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

#include "utils/logging.hpp"

namespace scriptbox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr int kTimeoutExitCode = 124;

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Pipes of one call must not leak into sandboxes spawned concurrently by
// other calls, or those would hold our stdin/stdout open. pipe2 sets
// close-on-exec atomically; the child's dup2 onto 0/1/2 clears it again.
bp::pipe OpenCloseOnExecPipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        throw bp::process_error(std::error_code(errno, std::system_category()), "pipe2(2) failed");
    }
    return bp::pipe(fds[0], fds[1]);
}

struct Channels {
    Channels()
        : input(OpenCloseOnExecPipe()),
          output(OpenCloseOnExecPipe()),
          error(OpenCloseOnExecPipe()) {}

    bp::opstream input;
    bp::ipstream output;
    bp::ipstream error;
};

bool WritePayload(bp::opstream& input, const std::string& payload) {
    input << payload << '\n';
    input.flush();
    const bool ok = static_cast<bool>(input);
    input.pipe().close();
    return ok;
}

std::string DrainLines(bp::ipstream& stream) {
    std::string text;
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        text += line;
    }
    return text;
}

std::string DrainAll(bp::ipstream& stream) {
    std::ostringstream oss;
    oss << stream.rdbuf();
    return oss.str();
}

int DecodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

ProcessResult ProcessLauncher::Run(const ProcessSpec& spec, const std::string& payload) {
    ProcessResult result{};
    IgnoreSigpipe();

    // Nothing from the host environment reaches the sandbox.
    bp::environment env;
    std::unique_ptr<Channels> channels;
    bp::group group;
    bp::child child;
    try {
        channels = std::make_unique<Channels>();
        child = bp::child(
            bp::exe = spec.executable.string(),
            bp::args = spec.args,
            env,
            bp::start_dir = spec.working_dir.string(),
            bp::std_in < channels->input,
            bp::std_out > channels->output,
            bp::std_err > channels->error,
            group);
    } catch (const std::system_error& ex) {
        result.launch_error = ex.what();
        utils::Log(utils::LogLevel::kError, "process",
                   "failed to start " + spec.executable.string() + ": " + ex.what());
        return result;
    }
    utils::Log(utils::LogLevel::kDebug, "process",
               "started pid=" + std::to_string(child.id()) + " exe=" + spec.executable.string());

    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    auto& input = channels->input;
    auto& output = channels->output;
    auto& error = channels->error;
    std::future<bool> writer;
    std::future<std::string> stdout_reader;
    std::future<std::string> stderr_reader;
    try {
        writer = std::async(std::launch::async, [&input, &payload] {
            return WritePayload(input, payload);
        });
        stdout_reader = std::async(std::launch::async, [&output] {
            return DrainLines(output);
        });
        stderr_reader = std::async(std::launch::async, [&error] {
            return DrainAll(error);
        });
    } catch (const std::system_error& ex) {
        // Tasks that did start finish once the group is gone; their futures
        // block on destruction until then.
        std::error_code kill_ec;
        group.terminate(kill_ec);
        child.wait(kill_ec);
        result.launch_error = std::string("failed to start I/O tasks: ") + ex.what();
        utils::Log(utils::LogLevel::kError, "process", result.launch_error);
        return result;
    }
    result.launched = true;

    std::error_code ec;
    bool exited = false;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!child.running(ec)) {
            exited = true;
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "process", "waitpid failed: " + ec.message());
    }

    // An exited child whose pipes are still held open by a descendant counts
    // as a hang too.
    const bool drained = exited &&
        stdout_reader.wait_until(deadline) == std::future_status::ready &&
        stderr_reader.wait_until(deadline) == std::future_status::ready;
    if (!drained) {
        result.timed_out = true;
        utils::Log(utils::LogLevel::kWarn, "process",
                   "pid=" + std::to_string(child.id()) + " exceeded " +
                   std::to_string(spec.timeout.count()) + "ms, killing process group");
        group.terminate(ec);
        child.wait(ec);
    }

    result.output = stdout_reader.get();
    result.error = stderr_reader.get();
    if (!writer.get()) {
        utils::Log(utils::LogLevel::kWarn, "process", "payload was not fully delivered to the child");
    }

    if (result.timed_out) {
        result.exit_code = kTimeoutExitCode;
    } else {
        result.exit_code = DecodeExitStatus(child.native_exit_code());
    }
    return result;
}

}  // namespace scriptbox::sandbox
