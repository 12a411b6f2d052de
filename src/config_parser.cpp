#include "config_parser.hpp"
#include "normalizer.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace payline {

namespace {

// Thresholds may be written as numbers or strings; strings keep exact
// decimal text, numbers go through their JSON text form
Decimal parse_threshold(const json& value, const std::string& name) {
    std::string text;
    if (value.is_string()) {
        text = expand_environment_variables(value.get<std::string>());
    } else if (value.is_number()) {
        text = value.dump();
    } else {
        throw ConfigParseError("reconciliation." + name + " must be a number or a decimal string");
    }

    Decimal result;
    if (!Decimal::try_parse(trim(text), result)) {
        throw ConfigParseError("reconciliation." + name + " is not a decimal: " + text);
    }
    return result;
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name; names do not start with a digit
        size_t name_start = pos;
        if (pos < result.size() && !std::isdigit(static_cast<unsigned char>(result[pos]))) {
            while (pos < result.size() &&
                   (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
                pos++;
            }
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated ${: keep the text as written
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            // Lone '$' is literal
            pos = start + 1;
            continue;
        }

        // Get environment variable value
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

    // Resolve relative to config directory
    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

PaylineConfig parse_config_from_string(const std::string& json_string,
                                       const std::string& config_file_path) {
    PaylineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Configuration must be a JSON object");
        }

        // Parse conversion rules (optional)
        if (j.contains("conversion")) {
            const auto& conversion = j["conversion"];
            if (conversion.contains("emit_negative_expenses")) {
                config.reconcile.conversion.emit_negative_expenses =
                    conversion["emit_negative_expenses"].get<bool>();
            }
        }

        // Parse reconciliation thresholds (optional)
        if (j.contains("reconciliation")) {
            const auto& recon = j["reconciliation"];
            if (recon.contains("swap_amount_threshold")) {
                config.reconcile.swap_amount_threshold =
                    parse_threshold(recon["swap_amount_threshold"], "swap_amount_threshold");
            }
            if (recon.contains("swap_rate_threshold")) {
                config.reconcile.swap_rate_threshold =
                    parse_threshold(recon["swap_rate_threshold"], "swap_rate_threshold");
            }
            if (recon.contains("dob_confusion_year")) {
                int year = recon["dob_confusion_year"].get<int>();
                if (year < 1 || year > 9999) {
                    throw ConfigParseError("reconciliation.dob_confusion_year out of range: " +
                                           std::to_string(year));
                }
                config.reconcile.dob_confusion_year = year;
            }
        }

        // Parse logging (optional)
        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                std::string level = logging["level"].get<std::string>();
                if (!parse_level(level, config.logging.min_level)) {
                    throw ConfigParseError("Unknown logging.level: " + level);
                }
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                std::string path = expand_environment_variables(logging["file"].get<std::string>());
                if (!path.empty()) {
                    config.logging.enable_file = true;
                    config.logging.log_file_path = config_file_path.empty()
                        ? path
                        : resolve_relative_path(path, config_file_path);
                }
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

PaylineConfig parse_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return parse_config_from_string(buffer.str(), file_path);
}

} // namespace payline
