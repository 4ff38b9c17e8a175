#pragma once

#include "DataSource.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace dsconn {

// Option values handed to DatasourceConnectionProvider::configure()
using ConfigValue = std::variant<std::string, std::shared_ptr<DataSource>>;
using ConfigOptions = std::map<std::string, ConfigValue>;

// Recognized option keys
namespace settings {
constexpr const char* DATASOURCE = "datasource";
constexpr const char* USER = "user";
constexpr const char* PASS = "password";
}  // namespace settings

struct ProviderSettings {
    // Lookup name; empty when the source is injected
    std::string datasource;
    std::optional<std::string> user;
    std::optional<std::string> password;

    // Options for configure(); an injected source takes the place of the name
    ConfigOptions toOptions(std::shared_ptr<DataSource> injected = nullptr) const;
};

struct SourceSettings {
    std::string path;  // SQLite database file; empty = no injected source
    size_t pool_size = 5;
    std::optional<std::string> user;
    std::optional<std::string> password;
};

struct DirectorySettings {
    std::string name = "local";
    std::map<std::string, std::string> bindings;  // lookup name -> SQLite path
};

struct Config {
    ProviderSettings provider;
    SourceSettings source;
    DirectorySettings directory;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace dsconn
