#pragma once

/**
 * @file DatasourceConnectionProvider.hpp
 * @brief ConnectionProvider handing out connections from a DataSource.
 *
 * The DataSource is either injected (setDataSource() or a handle under the
 * "datasource" option) or looked up by name through a DirectoryLookupService
 * when the "datasource" option is a string.
 */

#include "Config.hpp"
#include "ConnectionProvider.hpp"
#include "DataSource.hpp"
#include "DirectoryLookupService.hpp"
#include "StateCodec.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dsconn {

/**
 * @class DatasourceConnectionProvider
 * @brief Lifecycle guard and delegation layer over a DataSource.
 *
 * Lifecycle: unconfigured -> configure() -> available -> stop() -> stopped.
 * A stopped provider rejects getConnection() until configured again.
 *
 * Thread Safety:
 * - All public methods may be called concurrently.
 * - getConnection() keeps its own reference to the source while acquiring,
 *   so a concurrent stop() never pulls the source out from under it.
 */
class DatasourceConnectionProvider : public ConnectionProvider {
public:
    struct InjectedSource {
        std::shared_ptr<DataSource> source;
    };
    struct NamedSource {
        std::string name;
    };
    using SourceBinding = std::variant<std::monostate, InjectedSource, NamedSource>;

    DatasourceConnectionProvider() = default;
    ~DatasourceConnectionProvider() override = default;

    std::shared_ptr<DataSource> getDataSource() const;
    void setDataSource(std::shared_ptr<DataSource> dataSource);

    void injectLookupService(std::shared_ptr<DirectoryLookupService> service);
    std::shared_ptr<DirectoryLookupService> lookupService() const;

    /**
     * @brief Read options and resolve the DataSource.
     * @param options "datasource" (handle or lookup name), "user", "password".
     * @throws ConfigurationError if no DataSource can be established; the
     *         provider is left unavailable.
     *
     * The "datasource" option is ignored while a source is already held.
     */
    void configure(const ConfigOptions& options);

    // Release the DataSource and become unavailable. Idempotent.
    void stop();

    bool isAvailable() const;
    SourceBinding binding() const;
    bool usesCredentials() const;

    // ----- ConnectionProvider interface implementation -----

    /**
     * @throws IllegalStateError when not available.
     * @throws ConnectionAcquisitionError when the DataSource fails.
     */
    std::unique_ptr<Connection> getConnection() override;

    // @throws ConnectionReleaseError when closing fails
    void closeConnection(std::unique_ptr<Connection> connection) override;

    bool supportsAggressiveRelease() const override { return true; }

    bool isUnwrappableAs(Capability capability) const override;
    Unwrapped unwrap(Capability capability) override;

    // ----- State capture -----

    /**
     * @brief Write the provider fields, without header.
     *
     * Order: available, user, password, lookup service, then only when
     * available the lookup name and, for an injected source, the source.
     * A looked-up source is never written; its name is.
     *
     * @throws StateFormatError if a collaborator to be written is not
     *         Externalizable.
     */
    void writeExternal(StateWriter& out) const;

    /**
     * @brief Replace this provider's state with one read from @p in.
     *
     * When the captured provider was available, the DataSource is resolved
     * again and the same ConfigurationErrors as configure() may be thrown.
     */
    void readExternal(StateReader& in, const CollaboratorRegistry& registry);

    // Header followed by writeExternal()
    std::string captureState() const;

    // Reverse of captureState(); trailing bytes are a StateFormatError
    static std::unique_ptr<DatasourceConnectionProvider> restoreState(
        std::string_view bytes, const CollaboratorRegistry& registry);

private:
    // Requires m_mutex
    void resolveLocked();

    mutable std::mutex m_mutex;
    SourceBinding m_binding;
    std::shared_ptr<DataSource> m_dataSource;  ///< Resolved source
    std::optional<std::string> m_user;
    std::optional<std::string> m_password;
    bool m_useCredentials = false;
    std::shared_ptr<DirectoryLookupService> m_lookupService;
    bool m_available = false;
};

}  // namespace dsconn
