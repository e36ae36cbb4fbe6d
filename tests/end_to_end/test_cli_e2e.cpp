/**
 * @file test_cli_e2e.cpp
 * @brief End-to-end runs of the ecv CLI on program snapshots
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sys/wait.h>

namespace {

namespace fs = std::filesystem;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

[[nodiscard]] std::string quote_path(const fs::path& path)
{
    return "\"" + path.string() + "\"";
}

[[nodiscard]] fs::path program(const std::string& name)
{
    return fs::path(ECV_TEST_DATA_DIR) / name;
}

/// Run `ecv <args>` with stdout sent to `stdout_path`; returns the exit status.
[[nodiscard]] int run_ecv(const std::vector<std::string>& args, const fs::path& stdout_path)
{
    std::string command = quote_path(ECV_CLI_PATH);
    for (const auto& arg : args) {
        command += " " + arg;
    }
    command += " > " + quote_path(stdout_path) + " 2>&1";
    const int status = std::system(command.c_str());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

[[nodiscard]] std::vector<std::string> verify_args(const std::string& input)
{
    return {"verify",
            "--input",
            quote_path(program(input)),
            "--manifest",
            quote_path(program("console.manifest.json")),
            "--schema-dir",
            quote_path(ECV_SCHEMA_DIR)};
}

std::string read_text(const fs::path& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

nlohmann::json load_json_file(const fs::path& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    return nlohmann::json::parse(in);
}

}  // namespace

TEST(CliEndToEnd, VersionAndUsage)
{
    TempDir dir("ecv_e2e_usage");
    const auto out = dir.path() / "stdout.txt";

    EXPECT_EQ(run_ecv({"version"}, out), 0);
    EXPECT_NE(read_text(out).find("ecv "), std::string::npos);
    EXPECT_NE(read_text(out).find("z3:"), std::string::npos);

    EXPECT_EQ(run_ecv({"verify", "--help"}, out), 0);
    EXPECT_NE(read_text(out).find("--disproven-error"), std::string::npos);

    EXPECT_EQ(run_ecv({}, out), 2);
    EXPECT_EQ(run_ecv({"prove"}, out), 2);
    EXPECT_EQ(run_ecv({"verify"}, out), 2);
    EXPECT_NE(read_text(out).find("--input is required"), std::string::npos);
}

TEST(CliEndToEnd, CleanProgramPassesAndWritesReport)
{
    TempDir dir("ecv_e2e_clean");
    const auto out = dir.path() / "stdout.txt";
    const auto report_path = dir.path() / "report.json";

    auto args = verify_args("clean.json");
    args.insert(args.end(), {"--output", quote_path(report_path)});
    ASSERT_EQ(run_ecv(args, out), 0) << read_text(out);

    const auto text = read_text(out);
    EXPECT_NE(text.find("Module Clean: 2 functions"), std::string::npos);
    EXPECT_NE(text.find("Contract verification: 1 proven, 0 unproven, 0 potentially violated, 0 unsupported"),
              std::string::npos);
    EXPECT_NE(text.find("Runtime checks: 1 elided, 0 kept"), std::string::npos);

    const auto report = load_json_file(report_path);
    EXPECT_EQ(report.at("schema_version"), "ecv.report.v1");
    EXPECT_EQ(report.at("summary").at("exit_code"), 0);
    EXPECT_TRUE(report.at("externals")
                    .at(0)
                    .at("source")
                    .get<std::string>()
                    .ends_with("console.manifest.json: member System.Console::WriteLine"));
}

TEST(CliEndToEnd, EffectViolationExitsWithFindings)
{
    TempDir dir("ecv_e2e_violation");
    const auto out = dir.path() / "stdout.txt";

    EXPECT_EQ(run_ecv(verify_args("effect_violation.json"), out), 1);
    const auto text = read_text(out);
    EXPECT_NE(text.find("error[effect-violation] Log (f001)"), std::string::npos) << text;
    EXPECT_NE(text.find("chain: f002 → f001 → System.Console.WriteLine"), std::string::npos) << text;

    auto relaxed = verify_args("effect_violation.json");
    relaxed.emplace_back("--no-effects");
    EXPECT_EQ(run_ecv(relaxed, out), 0);

    auto effects_only = verify_args("effect_violation.json");
    effects_only[0] = "effects";
    EXPECT_EQ(run_ecv(effects_only, out), 1);
    EXPECT_NE(read_text(out).find("Effects:"), std::string::npos);
}

TEST(CliEndToEnd, DisprovenContractIsWarningUnlessEscalated)
{
    TempDir dir("ecv_e2e_disproven");
    const auto out = dir.path() / "stdout.txt";

    EXPECT_EQ(run_ecv(verify_args("disproven.json"), out), 0);
    const auto text = read_text(out);
    EXPECT_NE(text.find("warning[contract-disproven] Dec (f001): Postcondition 'result >= 0' may be "
                        "violated in function 'Dec'. Counterexample: x = "),
              std::string::npos)
        << text;

    auto strict = verify_args("disproven.json");
    strict.emplace_back("--disproven-error");
    EXPECT_EQ(run_ecv(strict, out), 1);

    auto effects_only = verify_args("disproven.json");
    effects_only[0] = "effects";
    EXPECT_EQ(run_ecv(effects_only, out), 0);
    EXPECT_EQ(read_text(out).find("contract-disproven"), std::string::npos);
}

TEST(CliEndToEnd, UnknownExternalDependsOnMode)
{
    TempDir dir("ecv_e2e_unknown");
    const auto out = dir.path() / "stdout.txt";

    EXPECT_EQ(run_ecv(verify_args("unknown_call.json"), out), 1);
    EXPECT_NE(read_text(out).find("error[unknown-external-effect]"), std::string::npos);

    auto permissive = verify_args("unknown_call.json");
    permissive.emplace_back("--permissive");
    EXPECT_EQ(run_ecv(permissive, out), 0);
    EXPECT_NE(read_text(out).find("warning[unknown-external-effect]"), std::string::npos);
}

TEST(CliEndToEnd, InputErrorsExitWithTwo)
{
    TempDir dir("ecv_e2e_errors");
    const auto out = dir.path() / "stdout.txt";

    EXPECT_EQ(run_ecv(verify_args("malformed.json"), out), 2);
    EXPECT_EQ(run_ecv(verify_args("does_not_exist.json"), out), 2);

    auto bad_format = verify_args("clean.json");
    bad_format.insert(bad_format.end(), {"--format", "yaml"});
    EXPECT_EQ(run_ecv(bad_format, out), 2);
    EXPECT_EQ(read_text(out), "Error: Invalid --format value: yaml\n");

    auto bad_jobs = verify_args("clean.json");
    bad_jobs.insert(bad_jobs.end(), {"--jobs", "many"});
    EXPECT_EQ(run_ecv(bad_jobs, out), 2);
    EXPECT_EQ(read_text(out), "Error: Invalid --jobs value: many\n");

    const auto config_path = dir.path() / "config.json";
    std::ofstream(config_path) << R"({"verification": {"timeout_ms": "soon"}})";
    auto bad_config = verify_args("clean.json");
    bad_config.insert(bad_config.end(), {"--config", quote_path(config_path)});
    EXPECT_EQ(run_ecv(bad_config, out), 2);
}

TEST(CliEndToEnd, JsonOutputIsStableAcrossJobCountsAndCached)
{
    TempDir dir("ecv_e2e_json");
    const auto serial_out = dir.path() / "serial.json";
    const auto parallel_out = dir.path() / "parallel.json";
    const auto cached_out = dir.path() / "cached.json";

    auto serial = verify_args("clean.json");
    serial.insert(serial.end(), {"--format", "json", "--jobs", "1"});
    ASSERT_EQ(run_ecv(serial, serial_out), 0);
    auto parallel = verify_args("clean.json");
    parallel.insert(parallel.end(), {"--format", "json", "-j", "4"});
    ASSERT_EQ(run_ecv(parallel, parallel_out), 0);

    auto serial_report = load_json_file(serial_out);
    auto parallel_report = load_json_file(parallel_out);
    serial_report.erase("config");
    parallel_report.erase("config");
    EXPECT_EQ(serial_report, parallel_report);

    const auto cache_dir = dir.path() / "cache";
    auto cached = verify_args("clean.json");
    cached.insert(cached.end(), {"--format", "json", "--cache", quote_path(cache_dir)});
    ASSERT_EQ(run_ecv(cached, cached_out), 0);
    EXPECT_EQ(load_json_file(cached_out).at("cache").at("stored"), 1);
    ASSERT_EQ(run_ecv(cached, cached_out), 0);
    const auto second = load_json_file(cached_out);
    EXPECT_EQ(second.at("cache").at("hits"), 1);
    EXPECT_EQ(second.at("summary").at("proven"), 1);
}
