#pragma once

#include <memory>
#include <string>
#include <variant>

namespace dsconn {

// Forward declarations
class Connection;
class DataSource;
class ConnectionProvider;
class DatasourceConnectionProvider;

// Views a caller may ask a provider to present itself as
enum class Capability {
    ConnectionProvider,
    DatasourceConnectionProvider,
    DataSource,
    DriverManager,
    MultiTenantConnectionProvider
};

std::string capabilityName(Capability capability);

// Result of unwrap(); the alternative index follows the Capability order
using Unwrapped = std::variant<
    ConnectionProvider*,
    DatasourceConnectionProvider*,
    std::shared_ptr<DataSource>>;

class ConnectionProvider {
public:
    virtual ~ConnectionProvider() = default;

    // Non-copyable, non-movable
    ConnectionProvider(const ConnectionProvider&) = delete;
    ConnectionProvider& operator=(const ConnectionProvider&) = delete;

    virtual std::unique_ptr<Connection> getConnection() = 0;
    virtual void closeConnection(std::unique_ptr<Connection> connection) = 0;

    // Whether connections may be released and reacquired after each statement
    virtual bool supportsAggressiveRelease() const = 0;

    virtual bool isUnwrappableAs(Capability capability) const = 0;

    // Throws UnsupportedCapabilityError when isUnwrappableAs() is false
    virtual Unwrapped unwrap(Capability capability) = 0;

protected:
    ConnectionProvider() = default;
};

}  // namespace dsconn
