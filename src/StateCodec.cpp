#include "StateCodec.hpp"
#include <limits>

namespace dsconn {

// ============================================================================
// CollaboratorRegistry
// ============================================================================

void CollaboratorRegistry::registerFactory(const std::string& typeName, Factory factory) {
    m_factories[typeName] = std::move(factory);
}

bool CollaboratorRegistry::contains(const std::string& typeName) const {
    return m_factories.find(typeName) != m_factories.end();
}

std::shared_ptr<Externalizable> CollaboratorRegistry::create(const std::string& typeName,
                                                             StateReader& in) const {
    auto it = m_factories.find(typeName);
    if (it == m_factories.end()) {
        throw StateFormatError("No factory registered for captured type '" + typeName + "'");
    }
    auto object = it->second(in);
    if (!object) {
        throw StateFormatError("Factory for '" + typeName + "' did not produce an object");
    }
    return object;
}

// ============================================================================
// StateWriter
// ============================================================================

void StateWriter::writeHeader() {
    m_buffer.append(kStateMagic.data(), kStateMagic.size());
    writeUInt8(kStateVersion);
}

void StateWriter::writeBool(bool value) {
    writeUInt8(value ? 1 : 0);
}

void StateWriter::writeUInt8(uint8_t value) {
    m_buffer.push_back(static_cast<char>(value));
}

void StateWriter::writeUInt16(uint16_t value) {
    m_buffer.push_back(static_cast<char>((value >> 8) & 0xFF));
    m_buffer.push_back(static_cast<char>(value & 0xFF));
}

void StateWriter::writeUInt32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        m_buffer.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

void StateWriter::writeUTF(const std::string& value) {
    if (value.size() > std::numeric_limits<uint16_t>::max()) {
        throw StateFormatError("String of " + std::to_string(value.size()) +
                               " bytes is too long to encode");
    }
    writeUInt16(static_cast<uint16_t>(value.size()));
    m_buffer.append(value);
}

void StateWriter::writeNullableUTF(const std::optional<std::string>& value) {
    writeBool(value.has_value());
    if (value) {
        writeUTF(*value);
    }
}

void StateWriter::writeObject(const Externalizable* object) {
    writeBool(object != nullptr);
    if (!object) {
        return;
    }

    StateWriter payload;
    object->writeExternal(payload);
    if (payload.bytes().size() > std::numeric_limits<uint32_t>::max()) {
        throw StateFormatError("Captured object payload is too large");
    }

    writeUTF(object->externalTypeName());
    writeUInt32(static_cast<uint32_t>(payload.bytes().size()));
    m_buffer.append(payload.bytes());
}

// ============================================================================
// StateReader
// ============================================================================

StateReader::StateReader(std::string_view bytes) : m_bytes(bytes) {}

std::string_view StateReader::take(size_t count) {
    if (count > remaining()) {
        throw StateFormatError("Captured state is truncated: needed " + std::to_string(count) +
                               " bytes at offset " + std::to_string(m_pos) + ", " +
                               std::to_string(remaining()) + " left");
    }
    auto chunk = m_bytes.substr(m_pos, count);
    m_pos += count;
    return chunk;
}

uint8_t StateReader::readHeader() {
    if (take(kStateMagic.size()) != kStateMagic) {
        throw StateFormatError("Not a captured provider state (bad magic)");
    }
    uint8_t version = readUInt8();
    if (version != kStateVersion) {
        throw StateFormatError("Unsupported captured state version " + std::to_string(version));
    }
    return version;
}

bool StateReader::readBool() {
    uint8_t value = readUInt8();
    if (value > 1) {
        throw StateFormatError("Invalid boolean byte " + std::to_string(value) +
                               " at offset " + std::to_string(m_pos - 1));
    }
    return value == 1;
}

uint8_t StateReader::readUInt8() {
    return static_cast<uint8_t>(take(1)[0]);
}

uint16_t StateReader::readUInt16() {
    auto chunk = take(2);
    return static_cast<uint16_t>((static_cast<uint8_t>(chunk[0]) << 8) |
                                 static_cast<uint8_t>(chunk[1]));
}

uint32_t StateReader::readUInt32() {
    auto chunk = take(4);
    uint32_t value = 0;
    for (char c : chunk) {
        value = (value << 8) | static_cast<uint8_t>(c);
    }
    return value;
}

std::string StateReader::readUTF() {
    uint16_t length = readUInt16();
    return std::string(take(length));
}

std::optional<std::string> StateReader::readNullableUTF() {
    if (!readBool()) {
        return std::nullopt;
    }
    return readUTF();
}

bool StateReader::readObjectFrame(std::string& typeName, std::string_view& payload) {
    if (!readBool()) {
        return false;
    }
    typeName = readUTF();
    uint32_t length = readUInt32();
    payload = take(length);
    return true;
}

StateReader::ObjectRecord StateReader::skipObject() {
    ObjectRecord record;
    record.present = readObjectFrame(record.typeName, record.payload);
    return record;
}

}  // namespace dsconn
