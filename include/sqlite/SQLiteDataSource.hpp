#pragma once

/**
 * @file SQLiteDataSource.hpp
 * @brief DataSource over a pool of SQLite connections to one database file.
 *
 * SQLite has no server and no accounts. The source can still be given a
 * (user, password) pair which every acquisition must present, so it behaves
 * like a credentialed server-side DataSource towards its callers.
 */

#include "DataSource.hpp"
#include "SQLiteConnection.hpp"
#include "StateCodec.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dsconn {

/**
 * @class SQLiteDataSource
 * @brief Pooled SQLite DataSource.
 *
 * Connections handed out return their handle to the pool when closed or
 * destroyed. When the pool is full, or the source is already gone, the
 * handle is simply closed.
 *
 * Must be owned by a std::shared_ptr for handles to be returned to the pool.
 *
 * SQLite Concurrency Notes:
 * - Multiple connections can read simultaneously
 * - Only one connection can write at a time (database-level locking)
 */
class SQLiteDataSource : public DataSource,
                         public Externalizable,
                         public std::enable_shared_from_this<SQLiteDataSource> {
public:
    static constexpr const char* kTypeName = "dsconn.SQLiteDataSource";

    /**
     * @param dbPath Path to the SQLite database file (created if missing).
     * @param poolSize Maximum number of idle handles kept for reuse.
     */
    explicit SQLiteDataSource(const std::string& dbPath, size_t poolSize = 5);

    /**
     * @brief Destructor - closes all pooled handles.
     */
    ~SQLiteDataSource() override;

    // Require these credentials on every acquisition; nullopt for both disables the check
    void setCredentials(std::optional<std::string> user, std::optional<std::string> password);

    // ----- DataSource interface implementation -----

    /**
     * @throws DataSourceException (SQLITE_AUTH) when credentials are required,
     *         or with the open error when the database cannot be opened.
     */
    std::unique_ptr<Connection> getConnection() override;

    // @throws DataSourceException (SQLITE_AUTH) when the pair does not match
    std::unique_ptr<Connection> getConnection(const std::string& user,
                                              const std::string& password) override;

    // ----- Pool statistics -----

    size_t availableCount() const;
    // Handles currently open, idle or checked out
    size_t totalCount() const;

    // Close all idle handles
    void drain();

    const std::string& path() const { return m_dbPath; }
    size_t poolSize() const { return m_poolSize; }

    // ----- Externalizable -----

    std::string externalTypeName() const override { return kTypeName; }

    // Path, pool size and required credentials; never the live handles
    void writeExternal(StateWriter& out) const override;

    static std::shared_ptr<SQLiteDataSource> readExternal(StateReader& in);

    // Rebuild captured SQLite sources as new sources on the same file
    static void registerFactory(CollaboratorRegistry& registry);

    // Return a handle taken by acquire(); used by the connections handed out
    void release(std::unique_ptr<SQLiteConnection> conn);

private:
    std::unique_ptr<Connection> open();
    std::unique_ptr<SQLiteConnection> acquire();

    std::string m_dbPath;         ///< Path to SQLite database file
    size_t m_poolSize;            ///< Maximum pool size
    std::optional<std::string> m_user;
    std::optional<std::string> m_password;
    std::vector<std::unique_ptr<SQLiteConnection>> m_available;  ///< Idle connections
    std::atomic<size_t> m_createdCount{0};   ///< Open handles, idle or checked out
    mutable std::mutex m_mutex;   ///< Protects m_available and the credentials
};

}  // namespace dsconn
