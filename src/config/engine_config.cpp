/**
 * @file engine_config.cpp
 * @brief JSON and environment loading for the policy engine configuration
 */

#include <rbac/config/engine_config.hpp>

#include <rbac/compat/format.hpp>
#include <rbac/security/entity_ref.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace rbac::config {

namespace {
constexpr const char* kModule = "engine_config";

auto config_error(const std::string& message) -> VoidResult {
    return rbac_void_error(error_codes::config_error, message, kModule);
}

auto get_env(const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

void parse_database(const json& section, engine_config& config) {
    if (section.contains("path")) {
        config.database_path = section["path"].get<std::string>();
    }
    if (section.contains("wal_mode")) {
        config.database.wal_mode = section["wal_mode"].get<bool>();
    }
    if (section.contains("busy_timeout_ms")) {
        config.database.busy_timeout_ms = section["busy_timeout_ms"].get<int>();
    }
}

void parse_rbac(const json& section, engine_config& config) {
    if (section.contains("admin_role")) {
        config.admin_role = section["admin_role"].get<std::string>();
    }
    if (section.contains("max_hierarchy_depth")) {
        config.max_hierarchy_depth =
            section["max_hierarchy_depth"].get<std::size_t>();
    }
}

void parse_logging(const json& section, integration::logger_config& logging) {
    if (section.contains("directory")) {
        logging.log_directory = section["directory"].get<std::string>();
    }
    if (section.contains("level")) {
        logging.min_level =
            integration::parse_log_level(section["level"].get<std::string>());
    }
    if (section.contains("console")) {
        logging.enable_console = section["console"].get<bool>();
    }
    if (section.contains("file")) {
        logging.enable_file = section["file"].get<bool>();
    }
    if (section.contains("audit")) {
        logging.enable_audit_log = section["audit"].get<bool>();
    }
    if (section.contains("async")) {
        logging.async_mode = section["async"].get<bool>();
    }
    if (section.contains("max_file_size_mb")) {
        logging.max_file_size_mb = section["max_file_size_mb"].get<std::size_t>();
    }
    if (section.contains("max_files")) {
        logging.max_files = section["max_files"].get<std::size_t>();
    }
}
}  // namespace

auto engine_config::from_json(std::string_view text) -> Result<engine_config> {
    engine_config config;
    try {
        auto document = json::parse(text);

        if (document.contains("database")) {
            parse_database(document["database"], config);
        }
        if (document.contains("rbac")) {
            parse_rbac(document["rbac"], config);
        }
        if (document.contains("logging")) {
            parse_logging(document["logging"], config.logging);
        }
    } catch (const json::exception& ex) {
        return Result<engine_config>(
            config_error(compat::format("Invalid configuration: {}", ex.what()))
                .error());
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<engine_config>(valid.error());
    }
    return config;
}

auto engine_config::load_from_file(const std::filesystem::path& path)
    -> Result<engine_config> {
    std::ifstream file(path);
    if (!file) {
        return Result<engine_config>(
            config_error(compat::format("Failed to open configuration file: {}",
                                        path.string()))
                .error());
    }

    std::ostringstream content;
    content << file.rdbuf();
    return from_json(content.str());
}

auto engine_config::apply_environment(std::string_view prefix) -> VoidResult {
    const std::string p(prefix);

    if (auto value = get_env(p + "DATABASE_PATH")) {
        database_path = *value;
    }
    if (auto value = get_env(p + "ADMIN_ROLE")) {
        admin_role = *value;
    }
    if (auto value = get_env(p + "MAX_HIERARCHY_DEPTH")) {
        try {
            max_hierarchy_depth = static_cast<std::size_t>(std::stoul(*value));
        } catch (const std::exception&) {
            return config_error(compat::format(
                "{}MAX_HIERARCHY_DEPTH is not a number: '{}'", p, *value));
        }
    }
    if (auto value = get_env(p + "LOG_LEVEL")) {
        logging.min_level = integration::parse_log_level(*value);
    }
    if (auto value = get_env(p + "LOG_DIRECTORY")) {
        logging.log_directory = *value;
    }

    return validate();
}

auto engine_config::validate() const -> VoidResult {
    if (database_path.empty()) {
        return config_error("Database path must not be empty");
    }
    if (!security::is_role_ref(admin_role) ||
        !security::parse_entity_ref(admin_role)) {
        return config_error(compat::format(
            "Admin role '{}' is not a role reference (role:<namespace>/<name>)",
            admin_role));
    }
    if (max_hierarchy_depth == 0) {
        return config_error("Maximum hierarchy depth must be at least 1");
    }
    if (database.busy_timeout_ms < 0) {
        return config_error("Busy timeout must not be negative");
    }
    return ok();
}

}  // namespace rbac::config
