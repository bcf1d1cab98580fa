#include "sandbox/sandbox_executor.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <array>
#include <functional>
#include <mutex>
#include <system_error>
#include <utility>
#include <signal.h>
#include <sys/wait.h>

#include "utils/logging.hpp"

namespace margin::sandbox {
namespace bp = boost::process;
namespace asio = boost::asio;

namespace {

constexpr std::size_t kReadChunk = 4096;

void IgnoreSigpipe() {
    // A child that exits without draining stdin must not take us down.
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Ignored signals survive exec, so the child gets SIGPIPE back at its
// default disposition before the program image is loaded.
void RestoreChildSignals() {
    ::signal(SIGPIPE, SIG_DFL);
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

}  // namespace

std::string SandboxExecutor::ResolveProgram(const std::string& program) {
    if (program.empty()) {
        return {};
    }
    if (program.find('/') != std::string::npos) {
        boost::system::error_code ec;
        return boost::filesystem::is_regular_file(program, ec) ? program : std::string();
    }
    return bp::search_path(program).string();
}

ExecResult SandboxExecutor::Run(const ExecRequest& request,
                                Clock::time_point deadline,
                                const utils::CancellationToken& cancel) {
    ExecResult result{};
    if (cancel.IsCancelled()) {
        result.status = ExecStatus::kCancelled;
        return result;
    }
    const auto exe = ResolveProgram(request.program);
    if (exe.empty()) {
        result.status = ExecStatus::kNotFound;
        result.error = "exec: \"" + request.program + "\": executable file not found";
        return result;
    }
    if (request.input) {
        IgnoreSigpipe();
    }

    enum class Finish { kRunning, kCompleted, kTimedOut, kCancelled };

    asio::io_context ioc;
    bp::async_pipe out_pipe(ioc);
    bp::async_pipe in_pipe(ioc);
    asio::steady_timer timer(ioc);
    std::array<char, kReadChunk> chunk{};
    Finish finish = Finish::kRunning;
    bool exited = false;
    bool drained = false;
    std::string read_error;
    std::string wait_error;
    bp::child child;

    auto close_pipes = [&]() {
        boost::system::error_code ignored;
        out_pipe.close(ignored);
        in_pipe.close(ignored);
    };

    auto settle = [&]() {
        if (finish == Finish::kRunning && exited && drained) {
            finish = Finish::kCompleted;
            timer.cancel();
            close_pipes();
        }
    };

    auto stop = [&](Finish reason) {
        if (finish != Finish::kRunning) {
            return;
        }
        finish = reason;
        timer.cancel();
        if (!exited) {
            std::error_code ignored;
            child.terminate(ignored);
        }
        close_pipes();
    };

    auto on_exit = [&](int, const std::error_code& ec) {
        exited = true;
        if (ec) {
            wait_error = ec.message();
        }
        settle();
    };

    try {
        if (request.input) {
            child = bp::child(bp::exe = exe,
                              bp::args = request.args,
                              (bp::std_out & bp::std_err) > out_pipe,
                              bp::std_in < in_pipe,
                              ioc,
                              bp::on_exit(on_exit),
                              bp::extend::on_exec_setup([](auto&) { RestoreChildSignals(); }));
        } else {
            child = bp::child(bp::exe = exe,
                              bp::args = request.args,
                              (bp::std_out & bp::std_err) > out_pipe,
                              bp::std_in < bp::null,
                              ioc,
                              bp::on_exit(on_exit),
                              bp::extend::on_exec_setup([](auto&) { RestoreChildSignals(); }));
        }
    } catch (const bp::process_error& ex) {
        result.status = ex.code() == std::errc::no_such_file_or_directory
            ? ExecStatus::kNotFound
            : ExecStatus::kFailed;
        result.error = ex.what();
        utils::Log(utils::LogLevel::kWarn, "sandbox", "launch failed: " + exe + ": " + result.error);
        return result;
    }
    utils::Log(utils::LogLevel::kDebug, "sandbox",
               "started pid=" + std::to_string(child.id()) + " exe=" + exe);

    std::function<void()> read_more = [&]() {
        out_pipe.async_read_some(
            asio::buffer(chunk),
            [&](const boost::system::error_code& ec, std::size_t n) {
                if (n > 0) {
                    result.output.append(chunk.data(), n);
                }
                if (!ec) {
                    read_more();
                    return;
                }
                if (ec != asio::error::eof && ec != asio::error::operation_aborted &&
                    ec != asio::error::bad_descriptor) {
                    read_error = ec.message();
                }
                drained = true;
                settle();
            });
    };
    read_more();

    if (request.input) {
        asio::async_write(
            in_pipe,
            asio::buffer(*request.input),
            [&](const boost::system::error_code& ec, std::size_t) {
                if (ec && ec != asio::error::broken_pipe && ec != asio::error::operation_aborted) {
                    utils::Log(utils::LogLevel::kDebug, "sandbox", "stdin write failed: " + ec.message());
                }
                boost::system::error_code ignored;
                in_pipe.close(ignored);
            });
    }

    timer.expires_at(deadline);
    timer.async_wait([&](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        stop(Finish::kTimedOut);
    });

    auto subscription = cancel.Subscribe([&]() {
        asio::post(ioc, [&]() { stop(Finish::kCancelled); });
    });

    ioc.run();
    subscription.Reset();

    switch (finish) {
        case Finish::kTimedOut:
            result.status = ExecStatus::kTimedOut;
            result.exit_code = 124;
            break;
        case Finish::kCancelled:
            result.status = ExecStatus::kCancelled;
            result.exit_code = 130;
            break;
        case Finish::kCompleted:
        case Finish::kRunning:
            if (!wait_error.empty() || !read_error.empty()) {
                result.status = ExecStatus::kFailed;
                result.error = !wait_error.empty() ? "wait: " + wait_error : "read: " + read_error;
            } else {
                result.status = ExecStatus::kExited;
                result.exit_code = DecodeWaitStatus(child.native_exit_code());
            }
            break;
    }
    utils::Log(utils::LogLevel::kDebug, "sandbox",
               "finished pid=" + std::to_string(child.id()) +
               " exit=" + std::to_string(result.exit_code) +
               " bytes=" + std::to_string(result.output.size()));
    return result;
}

}  // namespace margin::sandbox
