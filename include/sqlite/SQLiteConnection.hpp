#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief RAII wrapper for an SQLite database handle.
 *
 * SQLiteDataSource keeps a pool of these; callers never see them directly
 * but receive a Connection that hands the wrapper back when closed.
 */

#include <sqlite3.h>
#include <string>

namespace dsconn {

/**
 * @class SQLiteConnection
 * @brief RAII wrapper for an SQLite database file connection.
 *
 * The handle is closed when the object is destroyed. A failed open leaves
 * the object invalid (isValid() == false) with the open error recorded.
 *
 * Usage:
 * @code
 *   SQLiteConnection conn("/path/to/database.db");
 *   if (conn.isValid() && !conn.execute("SELECT 1")) {
 *       spdlog::error("{}", conn.error());
 *   }
 * @endcode
 */
class SQLiteConnection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param dbPath Path to the SQLite database file.
     *
     * Creates the database file if it doesn't exist.
     */
    explicit SQLiteConnection(const std::string& dbPath);

    ~SQLiteConnection();

    // Non-copyable
    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Movable
    SQLiteConnection(SQLiteConnection&& other) noexcept;
    SQLiteConnection& operator=(SQLiteConnection&& other) noexcept;

    sqlite3* get() const { return m_db; }

    bool isValid() const { return m_db != nullptr; }

    /**
     * @brief Execute SQL, discarding any rows.
     * @return true on success, false on error (check error() for details).
     */
    bool execute(const std::string& sql);

    /**
     * @brief Last error message.
     *
     * For an invalid connection this is the message from the failed open.
     */
    std::string error() const;

    /**
     * @brief Last SQLite error code (SQLITE_OK = 0, SQLITE_ERROR = 1, etc.).
     */
    int errorCode() const;

    const std::string& path() const { return m_path; }

private:
    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
    std::string m_lastError;  ///< Set when open or exec fails
    int m_lastErrorCode = SQLITE_OK;
};

}  // namespace dsconn
