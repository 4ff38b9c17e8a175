#pragma once

#include <stdexcept>
#include <string>

namespace dsconn {

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Base of every error raised by the provider layer. Records the
// ErrorContext chain active at the throw site.
class ProviderException : public std::runtime_error {
public:
    explicit ProviderException(const std::string& message);

    const std::string& context() const { return m_context; }

private:
    std::string m_context;
};

// Missing or contradictory configuration / collaborators
class ConfigurationError : public ProviderException {
public:
    using ProviderException::ProviderException;
};

// Operation requires an available provider
class IllegalStateError : public ProviderException {
public:
    using ProviderException::ProviderException;
};

// Requested capability is not offered by the provider
class UnsupportedCapabilityError : public ProviderException {
public:
    using ProviderException::ProviderException;
};

// Captured state cannot be written or read back
class StateFormatError : public ProviderException {
public:
    using ProviderException::ProviderException;
};

// Pass-through of a failure reported by the underlying DataSource
class ConnectionError : public ProviderException {
public:
    ConnectionError(int errorCode, const std::string& message);

    int errorCode() const { return m_errorCode; }

private:
    int m_errorCode;
};

class ConnectionAcquisitionError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

class ConnectionReleaseError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

// Raised by DataSource / Connection implementations
class DataSourceException : public std::runtime_error {
public:
    DataSourceException(int errorCode, const std::string& message);

    int errorCode() const { return m_errorCode; }

private:
    int m_errorCode;
};

}  // namespace dsconn
