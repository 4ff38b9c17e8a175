#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace dsconn {

using json = nlohmann::json;

/**
 * @class StateInspector
 * @brief Decode a captured provider state for display.
 *
 * Nothing is resolved or rebuilt. Collaborators appear with their type name
 * and payload size; payloads of the bundled collaborator types are decoded
 * as well. Passwords are masked.
 */
class StateInspector {
public:
    // Throws StateFormatError for malformed input
    static json describe(std::string_view bytes);

    static std::string toString(const json& description, bool pretty = true);

private:
    static json describeObject(bool present, const std::string& typeName,
                               std::string_view payload);
};

}  // namespace dsconn
