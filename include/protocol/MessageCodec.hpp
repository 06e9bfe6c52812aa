#pragma once
#include <nlohmann/json.hpp>

#include <string>

namespace uai::protocol {

/**
 * Response: one operational-phase line from the controller
 * - valid: line is a JSON object with an integer "id" and "result" or "error"
 * - isError: payload came from "error"
 * - raw: original line
 */
struct Response {
    bool valid{false};
    int id{0};
    bool isError{false};
    nlohmann::json payload;
    std::string raw;
};

struct MessageCodec {
    // {"id":<id>,"method":"<method>","params":{...}} without the line terminator.
    // Null params are sent as an empty object.
    static std::string makeRequest(int id, const std::string& method, const nlohmann::json& params);

    // Never throws; a line that matches neither reply shape comes back with valid == false.
    static Response parse(const std::string& line);
};

} // namespace uai::protocol
