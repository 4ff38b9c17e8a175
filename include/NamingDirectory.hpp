#pragma once

#include "DirectoryLookupService.hpp"
#include "StateCodec.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dsconn {

/**
 * @class NamingDirectory
 * @brief In-memory, thread-safe DirectoryLookupService.
 *
 * Names are plain strings such as "jdbc/myDS". A name prefixed with the
 * environment context "java:comp/env/" finds the same binding as the bare
 * name.
 *
 * Capturing a directory records only its name: the bindings are live objects
 * of the environment. A restoring environment registers a factory that
 * returns its own directory of that name (see registerFactory()).
 */
class NamingDirectory : public DirectoryLookupService, public Externalizable {
public:
    static constexpr const char* kTypeName = "dsconn.NamingDirectory";
    static constexpr const char* kEnvironmentPrefix = "java:comp/env/";

    explicit NamingDirectory(std::string name = "local");

    // Non-copyable
    NamingDirectory(const NamingDirectory&) = delete;
    NamingDirectory& operator=(const NamingDirectory&) = delete;

    const std::string& name() const { return m_name; }

    // Throws std::invalid_argument for an empty name, a null object or an existing binding
    void bind(const std::string& name, std::shared_ptr<Bindable> object);

    // Bind, replacing any existing binding
    void rebind(const std::string& name, std::shared_ptr<Bindable> object);

    // Returns false when nothing was bound
    bool unbind(const std::string& name);

    std::shared_ptr<Bindable> locate(const std::string& name) const override;

    // Bound names in sorted order
    std::vector<std::string> list() const;

    std::string externalTypeName() const override { return kTypeName; }
    void writeExternal(StateWriter& out) const override;

    /**
     * @brief Make captured directories named like @p directory resolve to it.
     *
     * Restoring a capture of any other directory name fails with
     * StateFormatError.
     */
    static void registerFactory(CollaboratorRegistry& registry,
                                std::shared_ptr<NamingDirectory> directory);

private:
    static std::string normalize(const std::string& name);

    std::string m_name;
    std::map<std::string, std::shared_ptr<Bindable>> m_bindings;
    mutable std::shared_mutex m_mutex;
};

}  // namespace dsconn
