#include "Config.hpp"
#include "DatasourceConnectionProvider.hpp"
#include "ErrorHandler.hpp"
#include "NamingDirectory.hpp"
#include "SQLiteDataSource.hpp"
#include "StateInspector.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

using namespace dsconn;

namespace {

void setupLogging(bool verbose) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

        auto logger = std::make_shared<spdlog::logger>("dsconn", console_sink);
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

Config loadConfig(const std::string& path) {
    auto config = Config::loadFromFile(path);
    if (!config) {
        throw ConfigurationError("Could not load config file: " + path);
    }
    config->resolvePassword();
    if (!config->validate()) {
        throw ConfigurationError("Invalid configuration in " + path);
    }
    return *config;
}

// Directory with an SQLite source bound under every configured name
std::shared_ptr<NamingDirectory> buildDirectory(const Config& config) {
    auto directory = std::make_shared<NamingDirectory>(config.directory.name);
    for (const auto& binding : config.directory.bindings) {
        directory->bind(binding.first, std::make_shared<SQLiteDataSource>(
                                           binding.second, config.source.pool_size));
    }
    return directory;
}

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void writeFile(const std::string& path, const std::string& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + path + " for writing");
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("Failed writing " + path);
    }
}

int runCapture(const std::string& configPath, const std::string& outputPath) {
    ErrorContext ctx("capture");
    Config config = loadConfig(configPath);

    DatasourceConnectionProvider provider;
    provider.injectLookupService(buildDirectory(config));

    std::shared_ptr<DataSource> injected;
    if (!config.source.path.empty()) {
        auto source = std::make_shared<SQLiteDataSource>(config.source.path,
                                                         config.source.pool_size);
        source->setCredentials(config.source.user, config.source.password);
        injected = source;
    }

    provider.configure(config.provider.toOptions(injected));
    auto bytes = provider.captureState();
    provider.stop();

    writeFile(outputPath, bytes);
    std::cout << "Captured " << bytes.size() << " bytes to " << outputPath << std::endl;
    return 0;
}

int runInspect(const std::string& statePath, bool compact) {
    ErrorContext ctx("inspect");
    auto description = StateInspector::describe(readFile(statePath));
    std::cout << StateInspector::toString(description, !compact) << std::endl;
    return 0;
}

int runCheck(const std::string& configPath, const std::string& statePath) {
    ErrorContext ctx("check");
    Config config = loadConfig(configPath);

    CollaboratorRegistry registry;
    NamingDirectory::registerFactory(registry, buildDirectory(config));
    SQLiteDataSource::registerFactory(registry);

    auto provider = DatasourceConnectionProvider::restoreState(readFile(statePath), registry);
    if (!provider->isAvailable()) {
        std::cout << "Captured provider was stopped; nothing to check" << std::endl;
        return 0;
    }

    auto connection = provider->getConnection();
    connection->execute("SELECT 1");
    provider->closeConnection(std::move(connection));
    provider->stop();

    std::cout << "Connection check succeeded" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"dsconn-state - capture, inspect and check DataSource provider state"};
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    std::string configPath;
    std::string statePath;
    std::string outputPath;
    bool compact = false;

    auto* capture = app.add_subcommand("capture", "Configure a provider and write its state");
    capture->add_option("-c,--config", configPath, "Configuration file")->required();
    capture->add_option("-o,--output", outputPath, "State file to write")->required();

    auto* inspect = app.add_subcommand("inspect", "Print a captured state as JSON");
    inspect->add_option("state", statePath, "State file")->required();
    inspect->add_flag("--compact", compact, "Single-line JSON output");

    auto* check = app.add_subcommand("check", "Restore a state and acquire a connection");
    check->add_option("-c,--config", configPath, "Configuration file")->required();
    check->add_option("state", statePath, "State file")->required();

    CLI11_PARSE(app, argc, argv);

    setupLogging(verbose);

    try {
        if (*capture) return runCapture(configPath, outputPath);
        if (*inspect) return runInspect(statePath, compact);
        if (*check) return runCheck(configPath, statePath);
    } catch (const ProviderException& e) {
        if (e.context().empty()) {
            spdlog::error("{}", e.what());
        } else {
            spdlog::error("{}: {}", e.context(), e.what());
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 1;
}
