#include "ConnectionProvider.hpp"

namespace dsconn {

std::string capabilityName(Capability capability) {
    switch (capability) {
        case Capability::ConnectionProvider:
            return "ConnectionProvider";
        case Capability::DatasourceConnectionProvider:
            return "DatasourceConnectionProvider";
        case Capability::DataSource:
            return "DataSource";
        case Capability::DriverManager:
            return "DriverManager";
        case Capability::MultiTenantConnectionProvider:
            return "MultiTenantConnectionProvider";
    }
    return "Capability(" + std::to_string(static_cast<int>(capability)) + ")";
}

}  // namespace dsconn
