#include <string>

#include <gtest/gtest.h>

#include "command_text.hpp"
#include "helpers.hpp"

using namespace psrelay::core;

namespace
{

    bool contains(const std::string& haystack, const std::string& needle)
    {
        return haystack.find(needle) != std::string::npos;
    }

    RelayChannels sampleChannels()
    {
        RelayChannels ch;
        ch.stdoutPath = "/tmp/psrelay-a.out";
        ch.stderrPath = "/tmp/psrelay-a.err";
        ch.statusPath = "/tmp/psrelay-a.rc";
        ch.scriptPath = "/tmp/psrelay-a.ps1";
        return ch;
    }

} // namespace

TEST(CommandText, InterpreterArgumentsAreFixed)
{
    const auto args = interpreter_arguments("Write-Output 1");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "-NoProfile");
    EXPECT_EQ(args[1], "-Command");
    EXPECT_EQ(args[2], "Write-Output 1");
}

TEST(CommandText, DirectWrapsBodyAndWritesMarker)
{
    const auto text = build_direct_command(CommandSpec::inline_command("Write-Output 'hi'"));
    EXPECT_TRUE(contains(text, "UTF8Encoding $false"));
    EXPECT_TRUE(contains(text, "try {\nWrite-Output 'hi'\n} catch {"));
    EXPECT_TRUE(contains(text, "'<<<PSRELAY_RC:' + [string]$LASTEXITCODE + '>>>'"));
    EXPECT_FALSE(contains(text, "$ErrorActionPreference"));
}

TEST(CommandText, StopModeIsScopedToTheInvocation)
{
    const auto spec = CommandSpec::inline_command("Get-Item nope").with_error_mode(ErrorMode::Stop);
    EXPECT_TRUE(contains(build_direct_command(spec), "$ErrorActionPreference = 'Stop'"));
    EXPECT_TRUE(contains(build_relay_command(spec, sampleChannels(), InterpreterCapabilities{}),
                         "$ErrorActionPreference = 'Stop'"));
}

TEST(CommandText, EmptyBodyStillProducesText)
{
    const auto text = build_direct_command(CommandSpec::inline_command(""));
    EXPECT_TRUE(contains(text, "try {\n} catch {"));
}

TEST(CommandText, ScriptFileUsesCallOperatorWithQuotedArguments)
{
    const auto spec = CommandSpec::script_file("C:\\it's here\\run.ps1", {"a b", "o'k"});
    const auto text = build_direct_command(spec);
    EXPECT_TRUE(contains(text, "$__psrelay_args = @('a b', 'o''k')"));
    EXPECT_TRUE(contains(text, "& 'C:\\it''s here\\run.ps1' @__psrelay_args"));
    EXPECT_FALSE(contains(text, ". '"));
}

// U+2018..U+201B close a single-quoted literal just like the ASCII quote.
TEST(CommandText, TypographicQuotesAreDoubled)
{
    const std::string rsquo = "\xE2\x80\x99";
    const std::string lsquo = "\xE2\x80\x98";
    const auto spec = CommandSpec::script_file("/home/o" + rsquo + "brien/run.ps1",
                                               {"x" + rsquo + "; Remove-Item C:\\important; " + lsquo});
    const auto text = build_direct_command(spec);
    EXPECT_TRUE(contains(text, "@('x" + rsquo + rsquo + "; Remove-Item C:\\important; " + lsquo + lsquo + "')"));
    EXPECT_TRUE(contains(text, "& '/home/o" + rsquo + rsquo + "brien/run.ps1'"));

    EXPECT_EQ(psrelay::helpers::ps_quote("a\xE2\x80\x9A" "b\xE2\x80\x9B"),
              "'a\xE2\x80\x9A\xE2\x80\x9A" "b\xE2\x80\x9B\xE2\x80\x9B'");
    // Other characters of the same UTF-8 block pass through once.
    EXPECT_EQ(psrelay::helpers::ps_quote("\xE2\x80\x9C"), "'\xE2\x80\x9C'");
}

TEST(CommandText, RelayRedirectsIntoChannels)
{
    InterpreterCapabilities caps;
    caps.redirectableStreams = 6;
    const auto text = build_relay_command(CommandSpec::inline_command("ignored"), sampleChannels(), caps);

    EXPECT_TRUE(contains(text, "Set-ExecutionPolicy -Scope Process -ExecutionPolicy Bypass"));
    EXPECT_TRUE(contains(text, "& '/tmp/psrelay-a.ps1' 6>&1 5>&1 4>&1 3>&1 > '/tmp/psrelay-a.out' 2> '/tmp/psrelay-a.err'"));
    EXPECT_TRUE(contains(text, "Out-File -LiteralPath '/tmp/psrelay-a.err' -Append"));
    EXPECT_TRUE(contains(text, "[IO.File]::WriteAllText('/tmp/psrelay-a.rc', '<<<PSRELAY_RC:' + $__psrelay_rc + '>>>')"));
    EXPECT_TRUE(contains(text, "exit [int]$__psrelay_rc"));
    // The body itself travels through the script channel.
    EXPECT_FALSE(contains(text, "ignored"));
}

TEST(CommandText, RelayMergesOnlySupportedStreams)
{
    InterpreterCapabilities caps;
    caps.redirectableStreams = 2;
    const auto older = build_relay_command(CommandSpec::inline_command("x"), sampleChannels(), caps);
    EXPECT_TRUE(contains(older, "& '/tmp/psrelay-a.ps1' > '/tmp/psrelay-a.out'"));
    EXPECT_FALSE(contains(older, "3>&1"));

    caps.redirectableStreams = 5;
    const auto v3 = build_relay_command(CommandSpec::inline_command("x"), sampleChannels(), caps);
    EXPECT_TRUE(contains(v3, "5>&1 4>&1 3>&1 >"));
    EXPECT_FALSE(contains(v3, "6>&1"));
}

TEST(CommandText, RelayRunsScriptFilesDirectly)
{
    auto channels = sampleChannels();
    channels.scriptPath.reset();
    const auto text = build_relay_command(CommandSpec::script_file("/opt/job.ps1", {"-Force"}),
                                          channels, InterpreterCapabilities{});
    EXPECT_TRUE(contains(text, "$__psrelay_args = @('-Force')\n& '/opt/job.ps1' @__psrelay_args 6>&1"));
}

TEST(CommandText, ExtractsAndStripsMarker)
{
    std::string out = "hi\n<<<PSRELAY_RC:111>>>";
    auto marker = extract_exit_marker(out);
    EXPECT_TRUE(marker.found);
    ASSERT_TRUE(marker.exitCode.has_value());
    EXPECT_EQ(*marker.exitCode, 111);
    EXPECT_EQ(out, "hi\n");
}

TEST(CommandText, EmptyMarkerMeansNoExitCode)
{
    std::string out = "<<<PSRELAY_RC:>>>";
    auto marker = extract_exit_marker(out);
    EXPECT_TRUE(marker.found);
    EXPECT_FALSE(marker.exitCode.has_value());
    EXPECT_TRUE(out.empty());
}

TEST(CommandText, UsesLastMarkerAndIgnoresMalformedOnes)
{
    std::string out = "<<<PSRELAY_RC:1>>>x<<<PSRELAY_RC:-2>>>";
    auto marker = extract_exit_marker(out);
    ASSERT_TRUE(marker.exitCode.has_value());
    EXPECT_EQ(*marker.exitCode, -2);
    EXPECT_EQ(out, "<<<PSRELAY_RC:1>>>x");

    std::string bad = "text <<<PSRELAY_RC:abc>>>";
    EXPECT_FALSE(extract_exit_marker(bad).found);
    EXPECT_EQ(bad, "text <<<PSRELAY_RC:abc>>>");

    std::string none = "plain output";
    EXPECT_FALSE(extract_exit_marker(none).found);
}
