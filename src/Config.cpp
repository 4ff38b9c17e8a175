#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace dsconn {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}  // namespace

ConfigOptions ProviderSettings::toOptions(std::shared_ptr<DataSource> injected) const {
    ConfigOptions options;
    if (injected) {
        options[settings::DATASOURCE] = std::move(injected);
    } else if (!datasource.empty()) {
        options[settings::DATASOURCE] = datasource;
    }
    if (user) options[settings::USER] = *user;
    if (password) options[settings::PASS] = *password;
    return options;
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "provider") {
            if (key == "datasource") config.provider.datasource = value;
            else if (key == "user") config.provider.user = value;
            else if (key == "password") config.provider.password = value;
        }
        else if (current_section == "source") {
            if (key == "path") config.source.path = value;
            else if (key == "pool_size")
                config.source.pool_size = static_cast<size_t>(std::stoul(value));
            else if (key == "user") config.source.user = value;
            else if (key == "password") config.source.password = value;
        }
        else if (current_section == "directory") {
            if (key == "name") config.directory.name = value;
        }
        else if (current_section == "bindings") {
            config.directory.bindings[key] = value;
        }
    }

    return config;
}

bool Config::validate() const {
    if (provider.datasource.empty() && source.path.empty()) {
        spdlog::error("No datasource configured (set [provider] datasource or [source] path)");
        return false;
    }

    if (!provider.datasource.empty() && !source.path.empty()) {
        spdlog::error("Both a lookup name '{}' and an injected source '{}' are configured",
                      provider.datasource, source.path);
        return false;
    }

    if (!source.path.empty() && source.pool_size == 0) {
        spdlog::error("Source pool_size must be at least 1");
        return false;
    }

    if (!provider.datasource.empty() &&
        directory.bindings.find(provider.datasource) == directory.bindings.end()) {
        spdlog::warn("Nothing is bound under '{}' in directory '{}'",
                     provider.datasource, directory.name);
    }

    return true;
}

void Config::resolvePassword() {
    if (!provider.password) {
        const char* env_pwd = std::getenv("DSCONN_PASSWORD");
        if (env_pwd) {
            provider.password = std::string(env_pwd);
        }
    }
}

}  // namespace dsconn
