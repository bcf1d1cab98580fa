#include <gtest/gtest.h>

#include <chrono>

#include "nlohmann/json.hpp"

#include "runblock/backends.hpp"
#include "runblock/errors.hpp"
#include "test_helpers.hpp"

using namespace margin::runblock;
using margin::sandbox::ExecResult;
using margin::sandbox::ExecStatus;
using margin::sandbox::SandboxExecutor;

namespace {

Deadline In(std::chrono::milliseconds delay) {
    return std::chrono::steady_clock::now() + delay;
}

ExecutionOptions PosixOptions() {
    ExecutionOptions options;
    options.windows_host = false;
    return options;
}

std::string FindPython() {
    for (const char* name : {"python3", "python"}) {
        if (!SandboxExecutor::ResolveProgram(name).empty()) {
            return name;
        }
    }
    return {};
}

}  // namespace

TEST(ShellCandidates, ConfiguredShellComesFirst) {
    const auto candidates = ShellCandidates("/usr/bin/zsh", PosixOptions());
    const std::vector<std::string> expected = {"/usr/bin/zsh", "bash", "sh"};
    EXPECT_EQ(candidates, expected);
}

TEST(ShellCandidates, BlankAndDuplicateEntriesAreDropped) {
    const std::vector<std::string> expected = {"bash", "sh"};
    EXPECT_EQ(ShellCandidates("", PosixOptions()), expected);
    EXPECT_EQ(ShellCandidates("   ", PosixOptions()), expected);
    EXPECT_EQ(ShellCandidates("bash", PosixOptions()), expected);
    EXPECT_EQ(ShellCandidates(" sh ", PosixOptions()), (std::vector<std::string>{"sh", "bash"}));
}

TEST(ShellCandidates, WindowsHostAddsWindowsShells) {
    ExecutionOptions options;
    options.windows_host = true;
    const auto candidates = ShellCandidates("", options);
    ASSERT_EQ(candidates.size(), 5u);
    EXPECT_EQ(candidates[0], "bash");
    EXPECT_EQ(candidates[1], "sh");
    EXPECT_EQ(candidates[2], R"(C:\Program Files\Git\bin\bash.exe)");
    EXPECT_EQ(candidates[3], R"(C:\Program Files\Git\usr\bin\bash.exe)");
    EXPECT_EQ(candidates[4], "wsl.exe");
}

TEST(ShellArguments, DependOnShellFlavour) {
    EXPECT_EQ(ShellArguments("bash", "echo hi"), (std::vector<std::string>{"-lc", "echo hi"}));
    EXPECT_EQ(ShellArguments("/bin/sh", "echo hi"), (std::vector<std::string>{"-lc", "echo hi"}));
    EXPECT_EQ(ShellArguments("CMD.EXE", "dir"), (std::vector<std::string>{"/C", "dir"}));
    EXPECT_EQ(ShellArguments("cmd", "dir"), (std::vector<std::string>{"/C", "dir"}));
    EXPECT_EQ(ShellArguments("wsl.exe", "ls"), (std::vector<std::string>{"bash", "-lc", "ls"}));
    EXPECT_EQ(ShellArguments("wsl", "ls"), (std::vector<std::string>{"bash", "-lc", "ls"}));
}

TEST(ShellAttempt, ClassifiesExecStatus) {
    ExecResult result;
    result.status = ExecStatus::kNotFound;
    EXPECT_EQ(ClassifyShellAttempt(result), ShellAttempt::kNotFound);
    result.status = ExecStatus::kFailed;
    EXPECT_EQ(ClassifyShellAttempt(result), ShellAttempt::kLaunchError);
    result.status = ExecStatus::kExited;
    EXPECT_EQ(ClassifyShellAttempt(result), ShellAttempt::kRan);
    result.status = ExecStatus::kTimedOut;
    EXPECT_EQ(ClassifyShellAttempt(result), ShellAttempt::kRan);
}

TEST(NormalizeExecResult, MapsEveryStatus) {
    ExecResult result;
    result.output = "partial";
    result.status = ExecStatus::kTimedOut;
    auto normalized = NormalizeExecResult(result);
    EXPECT_EQ(normalized.exit_code, 124);
    EXPECT_EQ(normalized.output, "partial\ncommand timed out");

    result.status = ExecStatus::kCancelled;
    normalized = NormalizeExecResult(result);
    EXPECT_EQ(normalized.exit_code, 130);
    EXPECT_EQ(normalized.output, "partial\ncommand canceled");

    result.status = ExecStatus::kFailed;
    result.error = "boom";
    normalized = NormalizeExecResult(result);
    EXPECT_EQ(normalized.exit_code, 1);
    EXPECT_EQ(normalized.output, "partial\nboom");

    result.status = ExecStatus::kExited;
    result.exit_code = 7;
    normalized = NormalizeExecResult(result);
    EXPECT_EQ(normalized.exit_code, 7);
    EXPECT_EQ(normalized.output, "partial");
}

TEST(ShellBackend, EchoSucceeds) {
    const auto output = RunShell("echo hi", "sh", In(std::chrono::seconds(10)), {}, PosixOptions());
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_NE(output.output.find("hi"), std::string::npos);
}

TEST(ShellBackend, NonZeroExitIsPropagated) {
    const auto output = RunShell("echo oops 1>&2; exit 42", "sh", In(std::chrono::seconds(10)), {},
                                 PosixOptions());
    EXPECT_EQ(output.exit_code, 42);
    EXPECT_NE(output.output.find("oops"), std::string::npos);
}

TEST(ShellBackend, MissingConfiguredShellFallsThrough) {
    const auto output = RunShell("echo fallback", "/no/such/shell", In(std::chrono::seconds(10)), {},
                                 PosixOptions());
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_NE(output.output.find("fallback"), std::string::npos);
    EXPECT_EQ(output.output.find("not found"), std::string::npos);
}

TEST(ShellBackend, TimeoutReturns124) {
    const auto started = std::chrono::steady_clock::now();
    const auto output = RunShell("sleep 30", "sh", In(std::chrono::milliseconds(500)), {}, PosixOptions());
    EXPECT_EQ(output.exit_code, 124);
    EXPECT_NE(output.output.find("command timed out"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(ShellBackend, CancelledReturns130) {
    margin::utils::CancellationSource source;
    source.Cancel();
    const auto output = RunShell("echo never", "sh", In(std::chrono::seconds(10)), source.Token(),
                                 PosixOptions());
    EXPECT_EQ(output.exit_code, 130);
    EXPECT_NE(output.output.find("command canceled"), std::string::npos);
}

TEST(ShellBackend, NoShellFound) {
    ExecutionOptions options;
    options.windows_host = true;
    options.windows_shell_candidates = {"/no/such/bash.exe"};
    margin::testing::ScopedEnv path("PATH", "/margin-empty-path");
    try {
        RunShell("echo hi", "", In(std::chrono::seconds(10)), {}, options);
        ADD_FAILURE() << "expected NoShellFound";
    } catch (const RunBlockError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::kNoShellFound);
        EXPECT_NE(std::string(ex.what()).find("/no/such/bash.exe"), std::string::npos);
    }
}

TEST(JsonBackend, PrettyPrintsWithTwoSpaces) {
    const auto output = PrettyJson(R"({"b":[1,2],"a":1})");
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_EQ(output.output, "{\n  \"a\": 1,\n  \"b\": [\n    1,\n    2\n  ]\n}");
    EXPECT_EQ(nlohmann::json::parse(output.output), nlohmann::json::parse(R"({"a":1,"b":[1,2]})"));
}

TEST(JsonBackend, SimpleObjectRoundTrips) {
    const auto output = PrettyJson(R"({"a":1})");
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_EQ(output.output, "{\n  \"a\": 1\n}");
}

TEST(JsonBackend, InvalidInputReportsError) {
    const auto output = PrettyJson("{invalid");
    EXPECT_EQ(output.exit_code, 1);
    EXPECT_FALSE(output.output.empty());
}

TEST(SqlBackend, SplitsCommandWithQuotes) {
    const auto parts = SplitCommand(R"(sqlite3  -batch "my notes.db" 'a b')");
    const std::vector<std::string> expected = {"sqlite3", "-batch", "my notes.db", "a b"};
    EXPECT_EQ(parts, expected);
}

TEST(SqlBackend, OtherQuoteIsLiteralInsideQuotes) {
    const std::vector<std::string> apostrophe = {"sqlite3", "Bob's notes.db"};
    EXPECT_EQ(SplitCommand(R"(sqlite3 "Bob's notes.db")"), apostrophe);
    const std::vector<std::string> nested = {"sh", "-c", "echo 'a  b'"};
    EXPECT_EQ(SplitCommand(R"(sh -c "echo 'a  b'")"), nested);
    const std::vector<std::string> doubled = {"psql", "-c", R"(say "hi")"};
    EXPECT_EQ(SplitCommand(R"(psql -c 'say "hi"')"), doubled);
}

TEST(SqlBackend, BackslashEscapes) {
    const std::vector<std::string> bare = {"sqlite3", "my notes.db"};
    EXPECT_EQ(SplitCommand(R"(sqlite3 my\ notes.db)"), bare);
    const std::vector<std::string> quoted = {"x", R"(a"b\c$d`e\n)"};
    EXPECT_EQ(SplitCommand(R"(x "a\"b\\c\$d\`e\n")"), quoted);
    const std::vector<std::string> single = {"x", R"(a\nb)"};
    EXPECT_EQ(SplitCommand(R"(x 'a\nb')"), single);
}

TEST(SqlBackend, EmptyQuotedWordIsKept) {
    const std::vector<std::string> expected = {"sqlite3", "", "db"};
    EXPECT_EQ(SplitCommand(R"(sqlite3 "" db)"), expected);
}

TEST(SqlBackend, InvalidCommandsAreExecutionFailures) {
    for (const std::string command : {R"(sqlite3 "notes.db)", "sqlite3 'notes.db", "sqlite3 notes\\", "''", "   "}) {
        try {
            SplitCommand(command);
            ADD_FAILURE() << "expected ExecutionFailure for " << command;
        } catch (const RunBlockError& ex) {
            EXPECT_EQ(ex.kind(), ErrorKind::kExecutionFailure) << command;
            EXPECT_NE(std::string(ex.what()).find("invalid sql command"), std::string::npos);
        }
    }
}

TEST(SqlBackend, UnterminatedQuoteStartsNoProcess) {
    margin::testing::TempDir dir;
    const auto marker = (dir.path() / "ran").string();
    EXPECT_THROW(RunWithCommand("touch " + marker + " \"unterminated", "select 1;",
                                In(std::chrono::seconds(10)), {}),
                 RunBlockError);
    EXPECT_TRUE(dir.Empty());
}

TEST(SqlBackend, CodeIsDeliveredOnStdin) {
    const auto output = RunWithCommand("sh -c 'cat; echo done'", "select 1;", In(std::chrono::seconds(10)), {});
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_EQ(output.output, "select 1;done\n");
}

TEST(SqlBackend, MissingProgramIsReportedAsFailure) {
    const auto output = RunWithCommand("margin-no-such-sql-client", "select 1;",
                                       In(std::chrono::seconds(10)), {});
    EXPECT_EQ(output.exit_code, 1);
    EXPECT_NE(output.output.find("margin-no-such-sql-client"), std::string::npos);
}

TEST(PythonBackend, RunsScriptAndRemovesTempFile) {
    const auto python = FindPython();
    if (python.empty()) {
        GTEST_SKIP() << "no python interpreter on PATH";
    }
    margin::testing::TempDir tmp;
    margin::testing::ScopedEnv tmpdir("TMPDIR", tmp.path().string());
    const auto output = RunPython("import sys\nprint('hello')\nsys.exit(3)", python,
                                  In(std::chrono::seconds(20)), {});
    EXPECT_EQ(output.exit_code, 3);
    EXPECT_NE(output.output.find("hello"), std::string::npos);
    EXPECT_TRUE(tmp.Empty());
}

TEST(PythonBackend, ScriptFileHasPyExtension) {
    const auto python = FindPython();
    if (python.empty()) {
        GTEST_SKIP() << "no python interpreter on PATH";
    }
    const auto output = RunPython("import sys\nprint(sys.argv[0].endswith('.py'))", python,
                                  In(std::chrono::seconds(20)), {});
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_NE(output.output.find("True"), std::string::npos);
}

TEST(PythonBackend, MissingInterpreterStillRemovesTempFile) {
    margin::testing::TempDir tmp;
    margin::testing::ScopedEnv tmpdir("TMPDIR", tmp.path().string());
    const auto output = RunPython("print(1)", "margin-no-such-python", In(std::chrono::seconds(10)), {});
    EXPECT_EQ(output.exit_code, 1);
    EXPECT_NE(output.output.find("margin-no-such-python"), std::string::npos);
    EXPECT_TRUE(tmp.Empty());
}

TEST(Deadline, TimeoutIsClampedToMaximum) {
    const auto before = std::chrono::steady_clock::now();
    const auto deadline = DeadlineAfter(std::chrono::seconds(10000000000LL));
    EXPECT_GT(deadline, before + std::chrono::hours(23));
    EXPECT_LE(deadline, std::chrono::steady_clock::now() + kMaxExecutionTimeout);

    const auto negative = DeadlineAfter(std::chrono::milliseconds(-5));
    EXPECT_LE(negative, std::chrono::steady_clock::now());
    EXPECT_GE(negative, before);
}
