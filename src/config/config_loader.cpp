#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "routing/url_rebuilder.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>

using namespace std::string_literals;

namespace graphroute {

// ============================================================================
// TOML parsing with ${ENV} expansion
// ============================================================================

namespace {

// Replace each ${NAME} with the environment variable NAME (empty if unset)
std::string expand_env_vars(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    for (;;) {
        const size_t open = input.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(input.substr(pos));
            return out;
        }
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(input.substr(pos, open - pos));
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
}

// Walks tables and arrays, rewriting every string value in place
void expand_env_vars_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        str->get() = expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_env_vars_in(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_vars_in(child);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_in(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_in(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

void extract_connection(const toml::table& root, ClientConfig& cfg) {
    const auto* connection = root["connection"].as_table();
    if (!connection) return;
    const auto& c = *connection;

    cfg.url = c["url"].value_or(""s);
    cfg.connection.database = c["database"].value_or(cfg.connection.database);
    cfg.connection.auto_routing = c["auto_routing"].value_or(cfg.connection.auto_routing);
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

ClientConfig extract_all_sections(const toml::table& tbl) {
    ClientConfig config;
    extract_connection(tbl, config);
    config.logging = extract_logging(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ClientConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

void ConfigLoader::apply_logging(const LoggingConfig& logging) {
    if (const auto level = utils::log::parse_level(logging.level)) {
        utils::log::set_level(*level);
    } else {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level",
            logging.level));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ClientConfig& config) {
    std::vector<std::string> errors;

    if (config.url.empty()) {
        errors.push_back("connection.url must not be empty");
    } else if (!parse_url(config.url)) {
        errors.push_back("connection.url is not a valid URL");
    }

    if (config.connection.database.empty()) {
        errors.push_back("connection.database must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug|info|warn|error, got '{}'", config.logging.level));
    }

    return errors;
}

} // namespace graphroute
