/**
 * @file SQLiteDataSource.cpp
 * @brief Implementation of the pooled SQLite DataSource.
 */

#include "SQLiteDataSource.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace dsconn {

namespace {

// Connection handed to callers; gives its handle back to the source on close
class SQLitePooledConnection : public Connection {
public:
    SQLitePooledConnection(std::weak_ptr<SQLiteDataSource> source,
                           std::unique_ptr<SQLiteConnection> handle)
        : m_source(std::move(source)), m_handle(std::move(handle)) {}

    ~SQLitePooledConnection() override {
        SQLitePooledConnection::close();
    }

    void close() override {
        if (!m_handle) return;
        if (auto source = m_source.lock()) {
            source->release(std::move(m_handle));
        }
        m_handle.reset();
    }

    bool isClosed() const override { return !m_handle; }

    void execute(const std::string& sql) override {
        if (!m_handle) {
            throw DataSourceException(SQLITE_MISUSE, "Connection is closed");
        }
        if (!m_handle->execute(sql)) {
            throw DataSourceException(m_handle->errorCode(), m_handle->error());
        }
    }

private:
    std::weak_ptr<SQLiteDataSource> m_source;
    std::unique_ptr<SQLiteConnection> m_handle;
};

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteDataSource::SQLiteDataSource(const std::string& dbPath, size_t poolSize)
    : m_dbPath(dbPath), m_poolSize(poolSize) {
    // Pre-create some connections to reduce initial latency
    for (size_t i = 0; i < std::min(poolSize, size_t(2)); ++i) {
        auto conn = std::make_unique<SQLiteConnection>(dbPath);
        if (conn->isValid()) {
            m_available.push_back(std::move(conn));
            ++m_createdCount;
        }
    }
    spdlog::info("SQLite DataSource '{}' initialized with {} connections",
                 dbPath, m_available.size());
}

SQLiteDataSource::~SQLiteDataSource() {
    drain();
}

void SQLiteDataSource::setCredentials(std::optional<std::string> user,
                                      std::optional<std::string> password) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_user = std::move(user);
    m_password = std::move(password);
}

// ============================================================================
// Connection Acquisition and Release
// ============================================================================

std::unique_ptr<Connection> SQLiteDataSource::getConnection() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_user || m_password) {
            throw DataSourceException(SQLITE_AUTH,
                                      "Credentials are required for '" + m_dbPath + "'");
        }
    }
    return open();
}

std::unique_ptr<Connection> SQLiteDataSource::getConnection(const std::string& user,
                                                            const std::string& password) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if ((m_user || m_password) &&
            (user != m_user.value_or("") || password != m_password.value_or(""))) {
            throw DataSourceException(SQLITE_AUTH, "Access denied for user '" + user + "'");
        }
    }
    return open();
}

std::unique_ptr<Connection> SQLiteDataSource::open() {
    return std::make_unique<SQLitePooledConnection>(weak_from_this(), acquire());
}

std::unique_ptr<SQLiteConnection> SQLiteDataSource::acquire() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_available.empty()) {
            auto conn = std::move(m_available.back());
            m_available.pop_back();
            return conn;
        }
    }

    // Pool empty; SQLite handles concurrency via file locking
    auto conn = std::make_unique<SQLiteConnection>(m_dbPath);
    if (!conn->isValid()) {
        throw DataSourceException(conn->errorCode(), "Unable to open SQLite database '" +
                                  m_dbPath + "': " + conn->error());
    }
    ++m_createdCount;
    spdlog::debug("Created new SQLite connection (total: {})", m_createdCount.load());
    return conn;
}

void SQLiteDataSource::release(std::unique_ptr<SQLiteConnection> conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (conn->isValid() && m_available.size() < m_poolSize) {
        m_available.push_back(std::move(conn));
        return;
    }
    // Otherwise let it be destroyed (pool is full)
    --m_createdCount;
}

// ============================================================================
// Pool Statistics and Management
// ============================================================================

void SQLiteDataSource::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_createdCount -= m_available.size();
    m_available.clear();
    spdlog::info("SQLite DataSource '{}' drained", m_dbPath);
}

size_t SQLiteDataSource::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t SQLiteDataSource::totalCount() const {
    return m_createdCount;
}

// ============================================================================
// State Capture
// ============================================================================

void SQLiteDataSource::writeExternal(StateWriter& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    out.writeUTF(m_dbPath);
    if (m_poolSize > std::numeric_limits<uint32_t>::max()) {
        throw StateFormatError("Pool size " + std::to_string(m_poolSize) +
                               " is too large to encode");
    }
    out.writeUInt32(static_cast<uint32_t>(m_poolSize));
    out.writeNullableUTF(m_user);
    out.writeNullableUTF(m_password);
}

std::shared_ptr<SQLiteDataSource> SQLiteDataSource::readExternal(StateReader& in) {
    std::string path = in.readUTF();
    uint32_t poolSize = in.readUInt32();
    auto user = in.readNullableUTF();
    auto password = in.readNullableUTF();

    auto source = std::make_shared<SQLiteDataSource>(path, poolSize);
    source->setCredentials(std::move(user), std::move(password));
    return source;
}

void SQLiteDataSource::registerFactory(CollaboratorRegistry& registry) {
    registry.registerFactory(kTypeName, [](StateReader& in) -> std::shared_ptr<Externalizable> {
        return readExternal(in);
    });
}

}  // namespace dsconn
