// src/protocol/MessageCodec.cpp
#include "protocol/MessageCodec.hpp"

#include <limits>

namespace uai::protocol {

std::string MessageCodec::makeRequest(int id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json msg;
    msg["id"] = id;
    msg["method"] = method;
    msg["params"] = params.is_null() ? nlohmann::json::object() : params;
    return msg.dump();
}

Response MessageCodec::parse(const std::string& line) {
    Response resp;
    resp.raw = line;

    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return resp;
    }

    auto idIt = j.find("id");
    if (idIt == j.end() || !idIt->is_number_integer()) {
        return resp;
    }
    const auto id = idIt->get<long long>();
    if (id < std::numeric_limits<int>::min() || id > std::numeric_limits<int>::max()) {
        return resp;
    }
    resp.id = static_cast<int>(id);

    // "result" wins when both are present
    if (auto it = j.find("result"); it != j.end()) {
        resp.payload = std::move(*it);
    } else if (auto it = j.find("error"); it != j.end()) {
        resp.isError = true;
        resp.payload = std::move(*it);
    } else {
        return resp;
    }

    resp.valid = true;
    return resp;
}

} // namespace uai::protocol
