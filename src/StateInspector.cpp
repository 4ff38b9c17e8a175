#include "StateInspector.hpp"
#include "NamingDirectory.hpp"
#include "SQLiteDataSource.hpp"
#include "StateCodec.hpp"

namespace dsconn {

namespace {

constexpr const char* kMasked = "********";

json nullableString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

json StateInspector::describeObject(bool present, const std::string& typeName,
                                    std::string_view payload) {
    if (!present) {
        return nullptr;
    }

    json object;
    object["type"] = typeName;
    object["payload_bytes"] = payload.size();

    StateReader in(payload);
    if (typeName == NamingDirectory::kTypeName) {
        object["name"] = in.readUTF();
    } else if (typeName == SQLiteDataSource::kTypeName) {
        object["path"] = in.readUTF();
        object["pool_size"] = in.readUInt32();
        object["user"] = nullableString(in.readNullableUTF());
        object["password"] = in.readNullableUTF() ? json(kMasked) : json(nullptr);
    } else {
        // Opaque payload
        return object;
    }

    if (!in.atEnd()) {
        throw StateFormatError(std::to_string(in.remaining()) +
                               " unread bytes in captured object of type '" + typeName + "'");
    }
    return object;
}

json StateInspector::describe(std::string_view bytes) {
    StateReader in(bytes);

    json state;
    state["version"] = in.readHeader();

    bool available = in.readBool();
    state["available"] = available;
    state["user"] = nullableString(in.readNullableUTF());
    state["password"] = in.readNullableUTF() ? json(kMasked) : json(nullptr);

    auto lookup = in.skipObject();
    state["lookup_service"] = describeObject(lookup.present, lookup.typeName, lookup.payload);

    if (available) {
        auto name = in.readNullableUTF();
        state["lookup_name"] = nullableString(name);
        if (!name) {
            auto source = in.skipObject();
            state["injected_source"] = describeObject(source.present, source.typeName,
                                                      source.payload);
        }
    }

    if (!in.atEnd()) {
        throw StateFormatError(std::to_string(in.remaining()) +
                               " unexpected bytes after captured provider state");
    }
    return state;
}

std::string StateInspector::toString(const json& description, bool pretty) {
    return pretty ? description.dump(2) : description.dump();
}

}  // namespace dsconn
