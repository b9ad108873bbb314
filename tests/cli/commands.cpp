#include "taskmcp/version.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>

namespace
{

struct CommandResult
{
    int exit_code = -1;
    std::string output;
};

static std::filesystem::path find_taskmcp_exe(const char* argv0)
{
    std::filesystem::path p = argv0 ? std::filesystem::path(argv0) : std::filesystem::path();
    if (!p.is_absolute())
        p = std::filesystem::absolute(p);
    return p.parent_path() / "taskmcp";
}

static CommandResult run_capture(const std::string& command)
{
    CommandResult result;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe)
    {
        result.output = "failed to spawn command";
        return result;
    }

    std::ostringstream oss;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
        oss << buffer;

    int rc = pclose(pipe);
    result.exit_code = WIFEXITED(rc) ? WEXITSTATUS(rc) : rc;
    result.output = oss.str();
    return result;
}

static int assert_contains(const std::string& name, const CommandResult& r, int expected_exit,
                           const std::string& expected_substr)
{
    if (r.exit_code != expected_exit)
    {
        std::cerr << "[FAIL] " << name << ": exit_code=" << r.exit_code
                  << " expected=" << expected_exit << "\n"
                  << r.output << "\n";
        return 1;
    }
    if (r.output.find(expected_substr) == std::string::npos)
    {
        std::cerr << "[FAIL] " << name << ": expected output to contain: " << expected_substr
                  << "\n"
                  << r.output << "\n";
        return 1;
    }
    std::cout << "[OK] " << name << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    const auto exe = find_taskmcp_exe(argc > 0 ? argv[0] : nullptr);
    if (!std::filesystem::exists(exe))
    {
        std::cerr << "[FAIL] taskmcp executable not found next to test: " << exe.string() << "\n";
        return 1;
    }

    const std::string base = "\"" + exe.string() + "\"";
    const std::string redir = " 2>&1";
    const std::string nowhere = " --server-url http://127.0.0.1:1/mcp";

    int failures = 0;

    failures += assert_contains("--version", run_capture(base + " --version" + redir), 0,
                                TASKMCP_VERSION_STRING);
    failures += assert_contains("--help", run_capture(base + " --help" + redir), 0, "Usage:");
    failures += assert_contains("unknown command", run_capture(base + " frobnicate" + redir), 1,
                                "Usage:");
    failures += assert_contains("call rejects unknown flag",
                                run_capture(base + " call --not-a-real-flag" + redir), 1,
                                "Unknown argument: --not-a-real-flag");
    failures += assert_contains("call rejects non-integer duration",
                                run_capture(base + " call --duration soon" + nowhere + redir), 1,
                                "--duration expects an integer");
    failures += assert_contains("call against unreachable server",
                                run_capture(base + " call" + nowhere + redir), 2,
                                "Transport failure");
    failures += assert_contains("probe against unreachable server",
                                run_capture(base + " probe" + nowhere + redir), 2, "Probe failed");
    failures += assert_contains("bridge requires --script", run_capture(base + " bridge" + redir),
                                1, "Usage:");
    failures += assert_contains(
        "bridge against unreachable sandbox",
        run_capture(base + " bridge --script 'print(1)' --sandbox-url http://127.0.0.1:1/execute" +
                    nowhere + redir),
        2, "Connection Error");

    return failures == 0 ? 0 : 1;
}
