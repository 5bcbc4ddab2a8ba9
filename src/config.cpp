#include "config.hpp"
#include "errors.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace poolrisk {

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated "${": leave the text alone
                pos = start + 1;
                continue;
            }
            pos++;
        }

        if (var_name.empty() || std::isdigit(static_cast<unsigned char>(var_name[0]))) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

const json* section(const json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigParseError(std::string("'") + name + "' must be an object");
    }
    return &*it;
}

std::optional<std::string> path_value(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    return expand_environment_variables(it->get<std::string>());
}

std::optional<uint64_t> unsigned_value(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_unsigned()) {
        throw ConfigParseError(std::string("'") + key + "' must be a non-negative integer");
    }
    return it->get<uint64_t>();
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Run configuration must be a JSON object");
        }

        if (const json* inputs = section(j, "inputs")) {
            config.probabilities_path = path_value(*inputs, "probabilities");
            config.portfolio_path = path_value(*inputs, "portfolio");
        }

        if (const json* round = section(j, "round")) {
            if (auto matches = unsigned_value(*round, "matches")) {
                if (*matches == 0) {
                    throw ConfigParseError("'matches' must be positive");
                }
                config.expected_matches = static_cast<size_t>(*matches);
            }
        }

        if (const json* cols = section(j, "probability_columns")) {
            ProbabilityColumns columns;
            columns.match_id = cols->value("match_id", columns.match_id);
            columns.home = cols->value("home", columns.home);
            columns.draw = cols->value("draw", columns.draw);
            columns.away = cols->value("away", columns.away);
            config.probability_columns = columns;
        }

        if (const json* sim = section(j, "simulation")) {
            if (auto count = unsigned_value(*sim, "count")) {
                if (*count == 0) {
                    throw ConfigParseError("'count' must be positive");
                }
                config.num_simulations = static_cast<size_t>(*count);
            }
            config.seed = unsigned_value(*sim, "seed");
        }

        if (const json* risk = section(j, "risk")) {
            auto it = risk->find("alpha");
            if (it != risk->end() && !it->is_null()) {
                double alpha = it->get<double>();
                if (!(alpha > 0.0 && alpha < 1.0)) {
                    throw ConfigParseError("'alpha' must be in (0, 1)");
                }
                config.alpha = alpha;
            }
        }

        auto paytable = j.find("paytable");
        if (paytable != j.end() && !paytable->is_null()) {
            config.paytable = *paytable;
        }

        if (const json* outputs = section(j, "outputs")) {
            config.returns_path = path_value(*outputs, "returns");
            config.risk_path = path_value(*outputs, "risk");
            config.summary_path = path_value(*outputs, "summary");
            config.returns_parquet_path = path_value(*outputs, "returns_parquet");
        }

        if (const json* logging = section(j, "logging")) {
            if (logging->contains("level")) {
                config.log_level = (*logging)["level"].get<std::string>();
            }
            if (logging->contains("json")) {
                config.log_json = (*logging)["json"].get<bool>();
            }
            config.log_file = path_value(*logging, "file");
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    for (auto* path : {&config.probabilities_path, &config.portfolio_path,
                       &config.returns_path, &config.risk_path,
                       &config.summary_path, &config.returns_parquet_path,
                       &config.log_file}) {
        if (*path && !(*path)->empty()) {
            **path = resolve_relative_path(**path, file_path);
        }
    }

    return config;
}

} // namespace poolrisk
