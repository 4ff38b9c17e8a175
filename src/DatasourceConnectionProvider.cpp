/**
 * @file DatasourceConnectionProvider.cpp
 * @brief Resolution, lifecycle and state capture of the DataSource provider.
 */

#include "DatasourceConnectionProvider.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace dsconn {

namespace {

std::optional<std::string> readStringOption(const ConfigOptions& options, const char* key) {
    auto it = options.find(key);
    if (it == options.end()) {
        return std::nullopt;
    }
    const auto* value = std::get_if<std::string>(&it->second);
    if (!value) {
        throw ConfigurationError(std::string("Configuration property [") + key +
                                 "] must be a string");
    }
    return *value;
}

template <typename T>
const Externalizable* asExternalizable(const std::shared_ptr<T>& object, const char* what) {
    if (!object) {
        return nullptr;
    }
    const auto* ext = dynamic_cast<const Externalizable*>(object.get());
    if (!ext) {
        throw StateFormatError(std::string(what) + " cannot be captured: it is not Externalizable");
    }
    return ext;
}

}  // namespace

// ============================================================================
// Collaborators
// ============================================================================

std::shared_ptr<DataSource> DatasourceConnectionProvider::getDataSource() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dataSource;
}

void DatasourceConnectionProvider::setDataSource(std::shared_ptr<DataSource> dataSource) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (dataSource) {
        m_binding = InjectedSource{dataSource};
    } else {
        m_binding = std::monostate{};
        m_available = false;
    }
    m_dataSource = std::move(dataSource);
}

void DatasourceConnectionProvider::injectLookupService(
    std::shared_ptr<DirectoryLookupService> service) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lookupService = std::move(service);
}

std::shared_ptr<DirectoryLookupService> DatasourceConnectionProvider::lookupService() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lookupService;
}

// ============================================================================
// Lifecycle
// ============================================================================

void DatasourceConnectionProvider::configure(const ConfigOptions& options) {
    ErrorContext ctx("configure DataSource connection provider");

    auto user = readStringOption(options, settings::USER);
    auto password = readStringOption(options, settings::PASS);

    std::lock_guard<std::mutex> lock(m_mutex);

    // Without the option a name kept from an earlier configure() is used again
    auto it = options.find(settings::DATASOURCE);
    if (!m_dataSource && it != options.end()) {
        if (const auto* source = std::get_if<std::shared_ptr<DataSource>>(&it->second)) {
            if (*source) {
                m_binding = InjectedSource{*source};
                m_dataSource = *source;
            } else {
                m_binding = std::monostate{};
            }
        } else {
            m_binding = NamedSource{std::get<std::string>(it->second)};
        }
    }

    m_user = std::move(user);
    m_password = std::move(password);
    m_available = false;

    resolveLocked();
    m_available = true;

    if (const auto* named = std::get_if<NamedSource>(&m_binding)) {
        spdlog::info("Connection provider configured with DataSource '{}' from directory lookup",
                     named->name);
    } else {
        spdlog::info("Connection provider configured with injected DataSource");
    }
}

void DatasourceConnectionProvider::resolveLocked() {
    if (!m_dataSource) {
        const auto* named = std::get_if<NamedSource>(&m_binding);
        if (!named) {
            throw ConfigurationError(
                std::string("DataSource to use was not injected nor specified by [") +
                settings::DATASOURCE + "] configuration property");
        }
        if (!m_lookupService) {
            throw ConfigurationError("Unable to locate lookup service to resolve DataSource [" +
                                     named->name + "]");
        }

        auto bound = m_lookupService->locate(named->name);
        if (!bound) {
            throw ConfigurationError("Unable to determine appropriate DataSource to use: "
                                     "nothing bound under [" + named->name + "]");
        }
        m_dataSource = std::dynamic_pointer_cast<DataSource>(bound);
        if (!m_dataSource) {
            throw ConfigurationError("Object bound under [" + named->name +
                                     "] is not a DataSource");
        }
    }

    m_useCredentials = m_user.has_value() || m_password.has_value();
}

void DatasourceConnectionProvider::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_available && !m_dataSource) {
        return;
    }
    m_available = false;
    m_dataSource.reset();
    if (std::holds_alternative<InjectedSource>(m_binding)) {
        m_binding = std::monostate{};
    }
    spdlog::info("Connection provider stopped");
}

bool DatasourceConnectionProvider::isAvailable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available;
}

DatasourceConnectionProvider::SourceBinding DatasourceConnectionProvider::binding() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_binding;
}

bool DatasourceConnectionProvider::usesCredentials() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_useCredentials;
}

// ============================================================================
// Connection Acquisition and Release
// ============================================================================

std::unique_ptr<Connection> DatasourceConnectionProvider::getConnection() {
    std::shared_ptr<DataSource> source;
    bool useCredentials = false;
    std::string user;
    std::string password;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_available || !m_dataSource) {
            throw IllegalStateError("Provider is closed!");
        }
        source = m_dataSource;
        useCredentials = m_useCredentials;
        user = m_user.value_or("");
        password = m_password.value_or("");
    }

    std::unique_ptr<Connection> connection;
    try {
        connection = useCredentials ? source->getConnection(user, password)
                                    : source->getConnection();
    } catch (const DataSourceException& e) {
        throw ConnectionAcquisitionError(e.errorCode(),
                                         std::string("Unable to acquire connection: ") + e.what());
    }
    if (!connection) {
        throw ConnectionAcquisitionError(0, "DataSource returned no connection");
    }

    spdlog::debug("Acquired connection{}", useCredentials ? " with credentials" : "");
    return connection;
}

void DatasourceConnectionProvider::closeConnection(std::unique_ptr<Connection> connection) {
    if (!connection) return;

    try {
        connection->close();
    } catch (const DataSourceException& e) {
        throw ConnectionReleaseError(e.errorCode(),
                                     std::string("Unable to release connection: ") + e.what());
    }
    spdlog::debug("Released connection");
}

// ============================================================================
// Capability Introspection
// ============================================================================

bool DatasourceConnectionProvider::isUnwrappableAs(Capability capability) const {
    switch (capability) {
        case Capability::ConnectionProvider:
        case Capability::DatasourceConnectionProvider:
        case Capability::DataSource:
            return true;
        case Capability::DriverManager:
        case Capability::MultiTenantConnectionProvider:
            return false;
    }
    return false;
}

Unwrapped DatasourceConnectionProvider::unwrap(Capability capability) {
    switch (capability) {
        case Capability::ConnectionProvider:
            return static_cast<ConnectionProvider*>(this);
        case Capability::DatasourceConnectionProvider:
            return this;
        case Capability::DataSource:
            return getDataSource();
        case Capability::DriverManager:
        case Capability::MultiTenantConnectionProvider:
            break;
    }
    throw UnsupportedCapabilityError("Cannot unwrap connection provider as " +
                                     capabilityName(capability));
}

// ============================================================================
// State Capture
// ============================================================================

void DatasourceConnectionProvider::writeExternal(StateWriter& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    out.writeBool(m_available);
    out.writeNullableUTF(m_user);
    out.writeNullableUTF(m_password);
    out.writeObject(asExternalizable(m_lookupService, "Lookup service"));

    if (m_available) {
        std::optional<std::string> name;
        if (const auto* named = std::get_if<NamedSource>(&m_binding)) {
            name = named->name;
        }
        out.writeNullableUTF(name);
        // Only an injected source is written; a looked-up one is found again by name
        if (!name) {
            out.writeObject(asExternalizable(m_dataSource, "Injected DataSource"));
        }
    }
}

void DatasourceConnectionProvider::readExternal(StateReader& in,
                                                const CollaboratorRegistry& registry) {
    bool available = in.readBool();
    auto user = in.readNullableUTF();
    auto password = in.readNullableUTF();
    auto lookup = in.readObject<DirectoryLookupService>(registry);

    SourceBinding binding;
    std::shared_ptr<DataSource> source;
    if (available) {
        auto name = in.readNullableUTF();
        if (name) {
            binding = NamedSource{*name};
        } else {
            source = in.readObject<DataSource>(registry);
            if (source) {
                binding = InjectedSource{source};
            }
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_binding = std::move(binding);
    m_dataSource = std::move(source);
    m_user = std::move(user);
    m_password = std::move(password);
    m_useCredentials = false;
    m_lookupService = std::move(lookup);
    m_available = false;

    if (available) {
        resolveLocked();
        m_available = true;
    }
    spdlog::debug("Connection provider state restored ({})", available ? "available" : "stopped");
}

std::string DatasourceConnectionProvider::captureState() const {
    StateWriter out;
    out.writeHeader();
    writeExternal(out);
    return out.bytes();
}

std::unique_ptr<DatasourceConnectionProvider> DatasourceConnectionProvider::restoreState(
    std::string_view bytes, const CollaboratorRegistry& registry) {
    ErrorContext ctx("restore DataSource connection provider");

    StateReader in(bytes);
    in.readHeader();

    auto provider = std::make_unique<DatasourceConnectionProvider>();
    provider->readExternal(in, registry);

    if (!in.atEnd()) {
        throw StateFormatError(std::to_string(in.remaining()) +
                               " unexpected bytes after captured provider state");
    }
    return provider;
}

}  // namespace dsconn
