#pragma once

#include <memory>
#include <string>

namespace dsconn {

// Anything a directory can hand out under a name
class Bindable {
public:
    virtual ~Bindable() = default;
};

/**
 * @class Connection
 * @brief A live connection obtained from a DataSource.
 *
 * Implementations report failures by throwing DataSourceException.
 * A connection is owned by the caller until closed; closing returns the
 * underlying handle to the source it came from.
 */
class Connection {
public:
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    virtual void close() = 0;
    virtual bool isClosed() const = 0;

    // Run a statement that returns no rows
    virtual void execute(const std::string& sql) = 0;

protected:
    Connection() = default;
};

/**
 * @class DataSource
 * @brief Pooled connection source. Pooling, eviction and health checking
 *        are entirely the implementation's concern.
 */
class DataSource : public Bindable {
public:
    virtual std::unique_ptr<Connection> getConnection() = 0;
    virtual std::unique_ptr<Connection> getConnection(const std::string& user,
                                                      const std::string& password) = 0;
};

}  // namespace dsconn
