#pragma once

#include "DataSource.hpp"
#include <memory>
#include <string>

namespace dsconn {

// Resolves names to objects bound in some naming environment
class DirectoryLookupService {
public:
    virtual ~DirectoryLookupService() = default;

    // Returns nullptr when nothing is bound under the name
    virtual std::shared_ptr<Bindable> locate(const std::string& name) const = 0;
};

}  // namespace dsconn
