#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

using Catch::Matchers::ContainsSubstring;
namespace fs = std::filesystem;

namespace {

const std::string ENGINE = POOLRISK_ENGINE_PATH;
const std::string DATA_DIR = POOLRISK_DATA_DIR;

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    // Per-process names so parallel test processes do not collide
    const std::string tag = std::to_string(getpid());
    std::string stdout_file = (fs::temp_directory_path() / ("poolrisk_test_stdout_" + tag + ".txt")).string();
    std::string stderr_file = (fs::temp_directory_path() / ("poolrisk_test_stderr_" + tag + ".txt")).string();

    std::string full_cmd = "\"" + ENGINE + "\" " + args + " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    result.exit_code = WEXITSTATUS(status);
    return result;
}

std::string sample_inputs() {
    return "--probabilities " + DATA_DIR + "/sample_probabilities.csv"
           " --portfolio " + DATA_DIR + "/sample_portfolio_plan.csv";
}

// Scratch directory removed at the end of each test
struct ScratchDir {
    fs::path path;
    explicit ScratchDir(const std::string& name)
        : path(fs::temp_directory_path() / (name + "_" + std::to_string(getpid()))) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ignored;
        fs::remove_all(path, ignored);
    }
};

} // anonymous namespace

// ============================================================================
// Usage
// ============================================================================

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("Usage:"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("--probabilities"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("--portfolio"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("--paytable-json"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("--sims"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("--alpha"));
}

TEST_CASE("CLI without arguments shows usage", "[cli]") {
    auto result = run_command("");
    REQUIRE(result.exit_code == 0);
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("Usage:"));
}

TEST_CASE("CLI rejects bad arguments", "[cli]") {
    SECTION("Unknown option") {
        auto result = run_command("--frobnicate");
        REQUIRE(result.exit_code == 1);
        REQUIRE_THAT(result.stderr_output, ContainsSubstring("Unknown option"));
    }

    SECTION("Missing portfolio") {
        auto result = run_command("--probabilities " + DATA_DIR + "/sample_probabilities.csv");
        REQUIRE(result.exit_code == 1);
        REQUIRE_THAT(result.stderr_output, ContainsSubstring("--portfolio is required"));
    }

    SECTION("Missing input file") {
        auto result = run_command("--probabilities /nonexistent.csv --portfolio " +
                                  DATA_DIR + "/sample_portfolio_plan.csv");
        REQUIRE(result.exit_code == 1);
        REQUIRE_THAT(result.stderr_output, ContainsSubstring("not found"));
    }

    SECTION("Non-numeric simulation count") {
        auto result = run_command(sample_inputs() + " --sims lots");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Alpha out of range") {
        auto result = run_command(sample_inputs() + " --alpha 1.5");
        REQUIRE(result.exit_code == 1);
        REQUIRE_THAT(result.stderr_output, ContainsSubstring("--alpha"));
    }

    SECTION("Unknown log level") {
        auto result = run_command(sample_inputs() + " --log-level chatty");
        REQUIRE(result.exit_code == 1);
    }
}

// ============================================================================
// Runs
// ============================================================================

TEST_CASE("CLI prints the risk report to stdout", "[cli]") {
    auto result = run_command(sample_inputs() + " --sims 2000 --seed 7");
    REQUIRE(result.exit_code == 0);
    REQUIRE_THAT(result.stdout_output, ContainsSubstring("metric,value"));
    REQUIRE_THAT(result.stdout_output, ContainsSubstring("VaR95,"));
    REQUIRE_THAT(result.stdout_output, ContainsSubstring("ES95,"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("run_complete"));
}

TEST_CASE("CLI writes output files", "[cli]") {
    ScratchDir dir("poolrisk_cli_outputs");
    fs::path returns = dir.path / "returns.csv";
    fs::path risk = dir.path / "risk.csv";
    fs::path summary = dir.path / "summary.json";

    auto result = run_command(sample_inputs() + " --sims 1500 --seed 2025 --alpha 0.99" +
                              " --returns-out " + returns.string() +
                              " --risk-out " + risk.string() +
                              " --summary-out " + summary.string());
    REQUIRE(result.exit_code == 0);

    std::istringstream returns_csv(read_file(returns));
    std::string line;
    std::getline(returns_csv, line);
    REQUIRE(line == "return");
    size_t rows = 0;
    while (std::getline(returns_csv, line)) {
        if (!line.empty()) ++rows;
    }
    REQUIRE(rows == 1500);

    std::string risk_csv = read_file(risk);
    REQUIRE_THAT(risk_csv, ContainsSubstring("metric,value\nVaR99,"));
    REQUIRE_THAT(risk_csv, ContainsSubstring("ES99,"));

    auto j = nlohmann::json::parse(read_file(summary));
    REQUIRE(j["run"]["simulations"] == 1500);
    REQUIRE(j["run"]["matches"] == 14);
    REQUIRE(j["tickets"].size() == 3);
}

TEST_CASE("CLI runs are reproducible with a seed", "[cli]") {
    auto first = run_command(sample_inputs() + " --sims 3000 --seed 11");
    auto second = run_command(sample_inputs() + " --sims 3000 --seed 11");
    REQUIRE(first.exit_code == 0);
    REQUIRE(first.stdout_output == second.stdout_output);
}

TEST_CASE("CLI uses a run configuration", "[cli]") {
    auto result = run_command("--config " + DATA_DIR + "/sample_config.json --sims 500 --log-text");
    REQUIRE(result.exit_code == 0);
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("explicit table"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("[INFO]"));
    REQUIRE_THAT(result.stdout_output, ContainsSubstring("VaR95,"));
}

TEST_CASE("CLI recovers from a malformed pay table", "[cli]") {
    auto result = run_command(sample_inputs() + " --sims 500 --paytable-json '{\"fourteen\": 1}'");
    REQUIRE(result.exit_code == 0);
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("Malformed pay table"));
    REQUIRE_THAT(result.stderr_output, ContainsSubstring("default binary scheme"));
}

TEST_CASE("CLI fatal errors write no outputs", "[cli]") {
    ScratchDir dir("poolrisk_cli_failure");
    fs::path risk = dir.path / "risk.csv";

    SECTION("Round size mismatch") {
        auto result = run_command(sample_inputs() + " --matches 13 --risk-out " + risk.string());
        REQUIRE(result.exit_code == 1);
        REQUIRE_THAT(result.stderr_output, ContainsSubstring("expected 13"));
        REQUIRE_FALSE(fs::exists(risk));
    }

    SECTION("Plan does not fit the round") {
        fs::path plan = dir.path / "plan.csv";
        {
            std::ofstream out(plan);
            out << "J1,J2,J3\n1,X,2\n";
        }
        auto result = run_command("--probabilities " + DATA_DIR + "/sample_probabilities.csv" +
                                  " --portfolio " + plan.string() + " --risk-out " + risk.string());
        REQUIRE(result.exit_code == 1);
        REQUIRE_FALSE(fs::exists(risk));
    }

    SECTION("Invalid probability row") {
        fs::path probs = dir.path / "probs.csv";
        {
            std::ofstream out(probs);
            out << "match_id,p_home,p_draw,p_away\nA,0.5,-0.2,0.7\n";
        }
        fs::path plan = dir.path / "plan.csv";
        {
            std::ofstream out(plan);
            out << "J1\n1\n";
        }
        auto result = run_command("--probabilities " + probs.string() +
                                  " --portfolio " + plan.string() + " --risk-out " + risk.string());
        REQUIRE(result.exit_code == 1);
        REQUIRE_THAT(result.stderr_output, ContainsSubstring("match 'A'"));
        REQUIRE_FALSE(fs::exists(risk));
    }

    SECTION("Unwritable summary path discards the other outputs") {
        fs::path returns = dir.path / "returns.csv";
        fs::path summary = dir.path / "nodir" / "summary.json";
        auto result = run_command(sample_inputs() + " --sims 1000" +
                                  " --returns-out " + returns.string() +
                                  " --summary-out " + summary.string() +
                                  " --risk-out " + risk.string());
        REQUIRE(result.exit_code == 1);
        REQUIRE_THAT(result.stderr_output, ContainsSubstring("summary.json"));
        REQUIRE_FALSE(fs::exists(returns));
        REQUIRE_FALSE(fs::exists(returns.string() + ".tmp"));
        REQUIRE_FALSE(fs::exists(risk));
        REQUIRE_FALSE(fs::exists(summary));
    }
}
