/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of RAII SQLite connection wrapper.
 */

#include "SQLiteConnection.hpp"
#include <spdlog/spdlog.h>

namespace dsconn {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(const std::string& dbPath) : m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        m_lastErrorCode = rc;
        m_lastError = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, m_lastError);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }
}

SQLiteConnection::~SQLiteConnection() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteConnection::SQLiteConnection(SQLiteConnection&& other) noexcept
    : m_db(other.m_db)
    , m_path(std::move(other.m_path))
    , m_lastError(std::move(other.m_lastError))
    , m_lastErrorCode(other.m_lastErrorCode) {
    other.m_db = nullptr;
}

SQLiteConnection& SQLiteConnection::operator=(SQLiteConnection&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        m_path = std::move(other.m_path);
        m_lastError = std::move(other.m_lastError);
        m_lastErrorCode = other.m_lastErrorCode;
        other.m_db = nullptr;
    }
    return *this;
}

// ============================================================================
// Query Execution
// ============================================================================

bool SQLiteConnection::execute(const std::string& sql) {
    if (!m_db) {
        return false;
    }
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        m_lastErrorCode = rc;
        m_lastError = errMsg ? errMsg : sqlite3_errstr(rc);
        spdlog::error("SQLite exec failed: {}", m_lastError);
        if (errMsg) sqlite3_free(errMsg);
        return false;
    }
    m_lastErrorCode = SQLITE_OK;
    m_lastError.clear();
    return true;
}

// ============================================================================
// Error and Status Information
// ============================================================================

std::string SQLiteConnection::error() const {
    if (!m_lastError.empty()) return m_lastError;
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    if (m_lastErrorCode != SQLITE_OK) return m_lastErrorCode;
    return m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
}

}  // namespace dsconn
