#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "command_invoker.hpp"

using namespace psrelay::core;

namespace fs = std::filesystem;

// End-to-end runs against the PowerShell installed on this machine.
class PowerShellScenarios : public ::testing::Test
{
protected:
    void SetUp() override
    {
        if (!invoker_.interpreter_available())
        {
            GTEST_SKIP() << "no usable '" << invoker_.config().powershellPath << "' on PATH";
        }
    }

    CommandResult run(const CommandSpec& spec) { return invoker_.run(spec); }

    CommandInvoker invoker_{Config{}};
};

TEST_F(PowerShellScenarios, NativeExitCode)
{
    const auto result = run(CommandSpec::inline_command("exit 111"));
    EXPECT_EQ(result.status, CommandStatus::NonZeroExit);
    EXPECT_EQ(result.exitCode, std::optional<int>(111));
}

TEST_F(PowerShellScenarios, WriteOutput)
{
    const auto result = run(CommandSpec::inline_command("Write-Output 'hi'"));
    EXPECT_EQ(result.status, CommandStatus::Success);
    EXPECT_EQ(result.out, "hi\n");
    EXPECT_TRUE(result.err.empty());
    EXPECT_FALSE(result.exitCode.has_value());
}

TEST_F(PowerShellScenarios, WriteErrorWithoutExitCode)
{
    const auto result = run(CommandSpec::inline_command("Write-Error 'boom'"));
    EXPECT_EQ(result.status, CommandStatus::TerminatingError);
    EXPECT_NE(result.err.find("boom"), std::string::npos);
}

TEST_F(PowerShellScenarios, SlowBodyTimesOut)
{
    const auto t0 = std::chrono::steady_clock::now();
    const auto spec = CommandSpec::inline_command("Start-Sleep -Seconds 10").with_timeout(std::chrono::milliseconds(100));
    const auto result = run(spec);
    EXPECT_EQ(result.status, CommandStatus::Timeout);
    EXPECT_TRUE(result.terminated);
    EXPECT_LT(std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count(), 8.0);
}

TEST_F(PowerShellScenarios, StopModeTurnsErrorsTerminating)
{
    const auto spec = CommandSpec::inline_command("Get-Item -LiteralPath '/psrelay/does/not/exist'; Write-Output 'after'")
                          .with_error_mode(ErrorMode::Stop);
    const auto result = run(spec);
    EXPECT_EQ(result.status, CommandStatus::TerminatingError);
    EXPECT_EQ(result.out.find("after"), std::string::npos);
}

TEST_F(PowerShellScenarios, UnknownCommandHint)
{
    const auto result = run(CommandSpec::inline_command("psrelay-no-such-command"));
    EXPECT_NE(result.status, CommandStatus::Success);
    EXPECT_EQ(result.hint, FailureHint::CommandNotFound);
}

TEST_F(PowerShellScenarios, NonAsciiOutput)
{
    const auto result = run(CommandSpec::inline_command("Write-Output ([string][char]0x00E9)"));
    EXPECT_EQ(result.status, CommandStatus::Success);
    EXPECT_EQ(result.out, "\xC3\xA9\n");
    EXPECT_EQ(result.encodingWarning, EncodingWarning::None);
}

TEST_F(PowerShellScenarios, ScriptFileWithArguments)
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    const fs::path script = fs::temp_directory_path() / ("psrelay_scenario_" + std::to_string(now) + ".ps1");
    {
        std::ofstream f(script, std::ios::binary);
        f << "param($a, $b)\nWrite-Output \"$a|$b\"\n";
    }

    const auto result = run(CommandSpec::script_file(script.string(), {"x y", "o'k"}));
    EXPECT_EQ(result.status, CommandStatus::Success);
    EXPECT_EQ(result.out, "x y|o'k\n");

    std::error_code ec;
    fs::remove(script, ec);
}

TEST_F(PowerShellScenarios, ProbedCapabilities)
{
    const auto& caps = invoker_.capabilities();
    ASSERT_TRUE(caps.version.has_value());
    if (caps.version->major >= 6)
    {
        EXPECT_EQ(caps.defaultEncoding, TextEncoding::Utf8NoBom);
    }
    else
    {
        EXPECT_EQ(caps.defaultEncoding, TextEncoding::Utf16LeBom);
    }
}
