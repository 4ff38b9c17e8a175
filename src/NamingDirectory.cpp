#include "NamingDirectory.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <stdexcept>

namespace dsconn {

NamingDirectory::NamingDirectory(std::string name) : m_name(std::move(name)) {}

std::string NamingDirectory::normalize(const std::string& name) {
    std::string prefix = kEnvironmentPrefix;
    if (name.compare(0, prefix.size(), prefix) == 0) {
        return name.substr(prefix.size());
    }
    return name;
}

void NamingDirectory::bind(const std::string& name, std::shared_ptr<Bindable> object) {
    auto key = normalize(name);
    if (key.empty()) {
        throw std::invalid_argument("Cannot bind an empty name");
    }
    if (!object) {
        throw std::invalid_argument("Cannot bind null object under '" + name + "'");
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_bindings.emplace(key, std::move(object)).second) {
        throw std::invalid_argument("Name '" + name + "' is already bound in directory '" +
                                    m_name + "'");
    }
    spdlog::debug("Bound '{}' in directory '{}'", key, m_name);
}

void NamingDirectory::rebind(const std::string& name, std::shared_ptr<Bindable> object) {
    auto key = normalize(name);
    if (key.empty()) {
        throw std::invalid_argument("Cannot bind an empty name");
    }
    if (!object) {
        throw std::invalid_argument("Cannot bind null object under '" + name + "'");
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_bindings[key] = std::move(object);
    spdlog::debug("Rebound '{}' in directory '{}'", key, m_name);
}

bool NamingDirectory::unbind(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_bindings.erase(normalize(name)) > 0;
}

std::shared_ptr<Bindable> NamingDirectory::locate(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_bindings.find(normalize(name));
    if (it == m_bindings.end()) {
        spdlog::debug("Nothing bound under '{}' in directory '{}'", name, m_name);
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> NamingDirectory::list() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_bindings.size());
    for (const auto& entry : m_bindings) {
        names.push_back(entry.first);
    }
    return names;
}

void NamingDirectory::writeExternal(StateWriter& out) const {
    out.writeUTF(m_name);
}

void NamingDirectory::registerFactory(CollaboratorRegistry& registry,
                                      std::shared_ptr<NamingDirectory> directory) {
    registry.registerFactory(kTypeName, [directory](StateReader& in) -> std::shared_ptr<Externalizable> {
        std::string name = in.readUTF();
        if (name != directory->name()) {
            throw StateFormatError("Captured directory '" + name +
                                   "' is not available (this environment has '" +
                                   directory->name() + "')");
        }
        return directory;
    });
}

}  // namespace dsconn
