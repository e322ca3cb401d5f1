/**
 * @file test_cli_options.cpp
 * @brief Unit tests for command line parsing and report formatting
 */

#include <gtest/gtest.h>

#include <cymo/cli/cli_options.h>

#include <sstream>
#include <string>
#include <vector>

namespace cymo::cli::test {

// =============================================================================
// Argument Parsing Tests
// =============================================================================

class CliOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static auto required() -> std::vector<std::string> {
        return {"-r", "/up", "-l", "./site", "-s", "ftp.example.org"};
    }

    static void expect_usage_error(const std::vector<std::string>& args) {
        auto options = parse_arguments(args);
        ASSERT_FALSE(options);
        EXPECT_EQ(options.error().code, error_code::invalid_configuration);
    }
};

TEST_F(CliOptionsTest, RequiredOptionsOnly) {
    auto options = parse_arguments(required());

    ASSERT_TRUE(options) << options.error().message;
    const auto& o = options.value();
    EXPECT_EQ(o.remote_path, "/up");
    EXPECT_EQ(o.local_path, "./site");
    EXPECT_EQ(o.server, "ftp.example.org");
    EXPECT_EQ(o.port, 21);
    EXPECT_FALSE(o.username.has_value());
    EXPECT_FALSE(o.password.has_value());
    EXPECT_FALSE(o.retry.has_value());
    EXPECT_FALSE(o.thread_count.has_value());
    EXPECT_EQ(o.level, log_level::info);
}

TEST_F(CliOptionsTest, LongOptionsAndInlineValues) {
    auto options = parse_arguments({"--remote-path=/www", "--local-path", "/srv/site",
                                    "--server=10.0.0.1", "--username", "me", "--password=pw",
                                    "--port", "2121", "--retry=0", "--thread", "8",
                                    "--files-per-thread", "2", "--timeout", "15",
                                    "--log-level=debug", "--log-json", "--mask-logs"});

    ASSERT_TRUE(options) << options.error().message;
    const auto& o = options.value();
    EXPECT_EQ(o.remote_path, "/www");
    EXPECT_EQ(o.local_path, "/srv/site");
    EXPECT_EQ(o.server, "10.0.0.1");
    EXPECT_EQ(o.username, "me");
    EXPECT_EQ(o.password, "pw");
    EXPECT_EQ(o.port, 2121);
    EXPECT_EQ(o.retry, 0u);
    EXPECT_EQ(o.thread_count, 8u);
    EXPECT_EQ(o.files_per_thread, 2u);
    EXPECT_EQ(o.timeout_seconds, 15u);
    EXPECT_EQ(o.level, log_level::debug);
    EXPECT_TRUE(o.log_json);
    EXPECT_TRUE(o.mask_logs);
}

TEST_F(CliOptionsTest, ShortCredentialFlags) {
    auto args = required();
    args.insert(args.end(), {"-u", "alice", "-p", "s3cret", "-t", "3"});

    auto options = parse_arguments(args);

    ASSERT_TRUE(options);
    EXPECT_EQ(options.value().username, "alice");
    EXPECT_EQ(options.value().password, "s3cret");
    EXPECT_EQ(options.value().thread_count, 3u);
}

TEST_F(CliOptionsTest, HelpSkipsRequiredOptions) {
    auto options = parse_arguments({"--help"});

    ASSERT_TRUE(options);
    EXPECT_TRUE(options.value().show_help);
}

TEST_F(CliOptionsTest, VersionSkipsRequiredOptions) {
    auto options = parse_arguments({"-V"});

    ASSERT_TRUE(options);
    EXPECT_TRUE(options.value().show_version);
}

TEST_F(CliOptionsTest, MissingRequiredOption) {
    expect_usage_error({"-r", "/up", "-l", "./site"});
    expect_usage_error({"-r", "/up", "-s", "host"});
    expect_usage_error({"-l", "./site", "-s", "host"});
}

TEST_F(CliOptionsTest, UnknownOption) {
    auto args = required();
    args.push_back("--verbose");
    expect_usage_error(args);
}

TEST_F(CliOptionsTest, MissingValue) {
    expect_usage_error({"-r", "/up", "-l", "./site", "-s"});
}

TEST_F(CliOptionsTest, InvalidNumbers) {
    for (const auto& bad : std::vector<std::vector<std::string>>{
             {"--port", "0"},
             {"--port", "70000"},
             {"--port", "21x"},
             {"--retry", "-1"},
             {"-t", "0"},
             {"--timeout", "0"},
             {"--files-per-thread", "0"},
         }) {
        auto args = required();
        args.insert(args.end(), bad.begin(), bad.end());
        expect_usage_error(args);
    }
}

TEST_F(CliOptionsTest, UnknownLogLevel) {
    auto args = required();
    args.insert(args.end(), {"--log-level", "loud"});
    expect_usage_error(args);
}

// =============================================================================
// Conversion Tests
// =============================================================================

TEST_F(CliOptionsTest, ToUploadConfig) {
    auto args = required();
    args.insert(args.end(), {"-u", "me", "-p", "pw", "--retry", "5", "-t", "4",
                             "--timeout", "10", "--port", "2121"});
    auto options = parse_arguments(args);
    ASSERT_TRUE(options);

    auto config = to_upload_config(options.value());

    ASSERT_TRUE(config) << config.error().message;
    const auto& c = config.value();
    EXPECT_EQ(c.remote_path, "/up");
    EXPECT_EQ(c.server.host, "ftp.example.org");
    EXPECT_EQ(c.server.port, 2121);
    EXPECT_EQ(c.login.username, "me");
    EXPECT_EQ(c.retry_limit, 5u);
    EXPECT_EQ(c.thread_count, 4u);
    EXPECT_EQ(c.operation_timeout, std::chrono::seconds(10));
}

TEST_F(CliOptionsTest, RelativeRemotePathStaysRelative) {
    auto options =
        parse_arguments({"-r", "upload//site/", "-l", "./site", "-s", "ftp.example.org"});
    ASSERT_TRUE(options) << options.error().message;
    EXPECT_EQ(options.value().remote_path, "upload//site/");

    auto config = to_upload_config(options.value());

    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config.value().remote_path, "upload/site");
}

TEST_F(CliOptionsTest, UsernameWithoutPasswordRejectedByConfig) {
    auto args = required();
    args.insert(args.end(), {"-u", "me"});
    auto options = parse_arguments(args);
    ASSERT_TRUE(options);

    auto config = to_upload_config(options.value());

    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

TEST_F(CliOptionsTest, UsageMentionsEveryFlag) {
    std::ostringstream out;
    print_usage(out, "cymo");
    auto text = out.str();

    for (const char* flag : {"--remote-path", "--local-path", "--server", "--username",
                             "--password", "--port", "--retry", "--thread", "--timeout",
                             "--help", "--version"}) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
}

// =============================================================================
// Report Formatting Tests
// =============================================================================

class ReportFormatTest : public ::testing::Test {};

TEST_F(ReportFormatTest, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 bytes");
    EXPECT_EQ(format_bytes(1536), "1.50 KB");
    EXPECT_EQ(format_bytes(5ULL * 1024 * 1024), "5.00 MB");
    EXPECT_EQ(format_bytes(3ULL * 1024 * 1024 * 1024), "3.00 GB");
}

TEST_F(ReportFormatTest, FormatRateAndDuration) {
    EXPECT_EQ(format_rate(2048.0), "2.00 KB/s");
    EXPECT_EQ(format_duration(std::chrono::milliseconds(2500)), "2.50 s");
}

TEST_F(ReportFormatTest, ReportListsFailures) {
    run_report report;
    report.total_tasks = 3;
    report.succeeded_count = 1;
    report.failed_tasks = {"/dst/a.txt", "/dst/b.txt"};
    report.total_bytes = 1'000'000;
    report.total_duration = std::chrono::milliseconds(2000);
    report.average_speed = 500'000.0;

    auto text = format_report(report);

    EXPECT_NE(text.find("Total files:  3"), std::string::npos);
    EXPECT_NE(text.find("Succeeded:    1"), std::string::npos);
    EXPECT_NE(text.find("Failed:       2"), std::string::npos);
    EXPECT_NE(text.find("(1000000 bytes)"), std::string::npos);
    EXPECT_NE(text.find("Elapsed:      2.00 s"), std::string::npos);
    EXPECT_NE(text.find("Failed files:\n  /dst/a.txt\n  /dst/b.txt\n"), std::string::npos);
}

TEST_F(ReportFormatTest, CleanReportHasNoFailureSection) {
    run_report report;
    report.total_tasks = 1;
    report.succeeded_count = 1;

    EXPECT_EQ(format_report(report).find("Failed files:"), std::string::npos);
}

// =============================================================================
// Exit Code Tests
// =============================================================================

class ExitCodeTest : public ::testing::Test {};

TEST_F(ExitCodeTest, Success) {
    run_report report;
    report.total_tasks = 2;
    report.succeeded_count = 2;
    EXPECT_EQ(exit_code_for(report), exit_status::success);
}

TEST_F(ExitCodeTest, NothingToUploadIsSuccess) {
    EXPECT_EQ(exit_code_for(run_report{}), exit_status::success);
}

TEST_F(ExitCodeTest, AnyFailureIsUploadFailed) {
    run_report report;
    report.total_tasks = 2;
    report.succeeded_count = 1;
    report.failed_tasks = {"/x"};
    EXPECT_EQ(exit_code_for(report), exit_status::upload_failed);
}

TEST_F(ExitCodeTest, DistinctCodes) {
    EXPECT_EQ(exit_status::success, 0);
    EXPECT_EQ(exit_status::upload_failed, 1);
    EXPECT_EQ(exit_status::setup_failed, 2);
    EXPECT_EQ(exit_status::usage_error, 64);
}

}  // namespace cymo::cli::test
