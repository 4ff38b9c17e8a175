#include "ErrorHandler.hpp"

namespace dsconn {

thread_local std::string ErrorContext::s_currentContext;

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

ProviderException::ProviderException(const std::string& message)
    : std::runtime_error(message)
    , m_context(ErrorContext::current()) {
}

ConnectionError::ConnectionError(int errorCode, const std::string& message)
    : ProviderException(message)
    , m_errorCode(errorCode) {
}

DataSourceException::DataSourceException(int errorCode, const std::string& message)
    : std::runtime_error(message)
    , m_errorCode(errorCode) {
}

}  // namespace dsconn
