#pragma once

/**
 * @file StateCodec.hpp
 * @brief Binary codec for captured provider state.
 *
 * Values are written big-endian in the order the caller emits them; there is
 * no self-description beyond the header and the type names of captured
 * collaborators. Strings use a 16-bit length prefix followed by UTF-8 bytes.
 *
 * A collaborator (lookup service, injected source) is captured through the
 * Externalizable interface and rebuilt on the reading side by a factory
 * registered under its type name in a CollaboratorRegistry.
 */

#include "ErrorHandler.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dsconn {

class StateWriter;
class StateReader;

/**
 * @class Externalizable
 * @brief A collaborator able to write its own state into a StateWriter.
 */
class Externalizable {
public:
    virtual ~Externalizable() = default;

    /// Registry key used to find the factory that rebuilds this object.
    virtual std::string externalTypeName() const = 0;

    virtual void writeExternal(StateWriter& out) const = 0;
};

/**
 * @class CollaboratorRegistry
 * @brief Maps captured type names to factories in the restoring environment.
 *
 * A factory may build a fresh object from the payload or hand back an object
 * that already lives in the environment (a directory with the same name).
 */
class CollaboratorRegistry {
public:
    using Factory = std::function<std::shared_ptr<Externalizable>(StateReader&)>;

    void registerFactory(const std::string& typeName, Factory factory);
    bool contains(const std::string& typeName) const;

    // Throws StateFormatError for unknown type names or a factory returning null
    std::shared_ptr<Externalizable> create(const std::string& typeName,
                                           StateReader& in) const;

private:
    std::unordered_map<std::string, Factory> m_factories;
};

// Header written in front of every captured provider state
constexpr std::string_view kStateMagic = "DSCP";
constexpr uint8_t kStateVersion = 1;

class StateWriter {
public:
    void writeHeader();

    void writeBool(bool value);
    void writeUInt8(uint8_t value);
    void writeUInt16(uint16_t value);
    void writeUInt32(uint32_t value);

    // Throws StateFormatError when the UTF-8 encoding exceeds 65535 bytes
    void writeUTF(const std::string& value);
    void writeNullableUTF(const std::optional<std::string>& value);

    /**
     * @brief Capture a collaborator.
     *
     * Layout: presence flag, then (if present) type name, u32 payload length
     * and the payload produced by the object's writeExternal().
     */
    void writeObject(const Externalizable* object);

    const std::string& bytes() const { return m_buffer; }

private:
    std::string m_buffer;
};

class StateReader {
public:
    /// Summary of a captured collaborator read without rebuilding it
    struct ObjectRecord {
        bool present = false;
        std::string typeName;
        std::string_view payload;  ///< Views the reader's buffer
    };

    explicit StateReader(std::string_view bytes);

    // Throws StateFormatError on a bad magic or an unsupported version
    uint8_t readHeader();

    bool readBool();
    uint8_t readUInt8();
    uint16_t readUInt16();
    uint32_t readUInt32();
    std::string readUTF();
    std::optional<std::string> readNullableUTF();

    /**
     * @brief Rebuild a captured collaborator as T.
     * @return nullptr when the capture recorded an absent object.
     * @throws StateFormatError if the rebuilt object is not a T.
     */
    template <typename T>
    std::shared_ptr<T> readObject(const CollaboratorRegistry& registry) {
        std::string typeName;
        std::string_view payload;
        if (!readObjectFrame(typeName, payload)) {
            return nullptr;
        }
        StateReader nested(payload);
        auto object = std::dynamic_pointer_cast<T>(registry.create(typeName, nested));
        if (!nested.atEnd()) {
            throw StateFormatError(std::to_string(nested.remaining()) +
                                   " unread bytes in captured object of type '" +
                                   typeName + "'");
        }
        if (!object) {
            throw StateFormatError("Captured object of type '" + typeName +
                                   "' does not have the expected interface");
        }
        return object;
    }

    ObjectRecord skipObject();

    size_t remaining() const { return m_bytes.size() - m_pos; }
    bool atEnd() const { return remaining() == 0; }

private:
    bool readObjectFrame(std::string& typeName, std::string_view& payload);
    std::string_view take(size_t count);

    std::string_view m_bytes;
    size_t m_pos = 0;
};

}  // namespace dsconn
