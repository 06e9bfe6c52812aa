// src/client/UaiClient.cpp
#include "client/UaiClient.hpp"
#include "protocol/exceptions/ClientException.h"

#include <cstdint>
#include <limits>
#include <utility>

namespace uai::client {

using uai::protocol::ClientException;
using uai::protocol::ErrorKind;

namespace {
    ClientException badResult(const std::string& method, const nlohmann::json& result, const char* expected) {
        return ClientException(ErrorKind::ProtocolViolation,
                               method + " returned " + result.dump() + ", expected " + expected);
    }

    std::string stringField(const std::string& method, const nlohmann::json& result, const char* key) {
        if (!result.is_object()) throw badResult(method, result, "an object");
        auto it = result.find(key);
        if (it == result.end() || !it->is_string()) {
            throw badResult(method, result, (std::string("a string \"") + key + "\"").c_str());
        }
        return it->get<std::string>();
    }
} // namespace

UaiClient::UaiClient(uai::config::ConnectionSettings settings,
                     ReadyHandler onReady,
                     DisconnectedHandler onDisconnected,
                     Connection::TransportFactory transportFactory)
    : connection_(std::make_unique<Connection>(std::move(settings),
                                               std::move(onReady),
                                               std::move(onDisconnected),
                                               std::move(transportFactory))) {}

void UaiClient::connect() {
    connection_->connect();
    connection_->awaitReady();
}

void UaiClient::disconnect() {
    connection_->disconnect();
}

bool UaiClient::isConnected() const noexcept {
    return connection_->isReady();
}

nlohmann::json UaiClient::targetRequest(const std::string& method, const std::string& targetId, nlohmann::json extra) {
    nlohmann::json params = std::move(extra);
    params["targetID"] = targetId;
    return connection_->sendRequestAndAwait(method, params);
}

TargetInfo UaiClient::getTargetInfo(const std::string& targetId) {
    const std::string method = "status.info";
    auto result = targetRequest(method, targetId);
    TargetInfo info;
    info.name = stringField(method, result, "name");
    info.type = stringField(method, result, "type");
    return info;
}

int UaiClient::getTargetPosition(const std::string& targetId) {
    const std::string method = "status.position";
    auto result = targetRequest(method, targetId);
    if (!result.is_number_integer()) throw badResult(method, result, "an integer");

    constexpr auto lo = std::numeric_limits<int>::min();
    constexpr auto hi = std::numeric_limits<int>::max();
    const bool inRange = result.is_number_unsigned()
                             ? result.get<std::uint64_t>() <= static_cast<std::uint64_t>(hi)
                             : result.get<std::int64_t>() >= lo && result.get<std::int64_t>() <= hi;
    if (!inRange) throw badResult(method, result, "an integer in int range");
    return result.get<int>();
}

std::vector<std::string> UaiClient::getGroupsForTarget(const std::string& targetId) {
    const std::string method = "group.get";
    auto result = targetRequest(method, targetId);
    if (!result.is_array()) throw badResult(method, result, "an array");

    std::vector<std::string> groups;
    groups.reserve(result.size());
    for (const auto& g : result) {
        // ids are strings on current firmware; accept plain numbers too
        groups.push_back(g.is_string() ? g.get<std::string>() : g.dump());
    }
    return groups;
}

GroupInfo UaiClient::getGroupInfo(const std::string& groupId) {
    const std::string method = "status.info";
    auto result = connection_->sendRequestAndAwait(method, {{"groupID", groupId}});
    GroupInfo info;
    info.name = stringField(method, result, "name");
    return info;
}

void UaiClient::moveUp(const std::string& targetId) {
    targetRequest("move.up", targetId);
}

void UaiClient::moveDown(const std::string& targetId) {
    targetRequest("move.down", targetId);
}

void UaiClient::stop(const std::string& targetId) {
    targetRequest("move.stop", targetId);
}

void UaiClient::moveTo(const std::string& targetId, int position) {
    targetRequest("move.to", targetId, {{"position", position}});
}

void UaiClient::moveToIntermediatePosition(const std::string& targetId, int intermediatePosition) {
    targetRequest("move.ip", targetId, {{"value", intermediatePosition}});
}

void UaiClient::moveToNextIntermediatePosition(const std::string& targetId) {
    targetRequest("move.ip.next", targetId);
}

void UaiClient::moveToPreviousIntermediatePosition(const std::string& targetId) {
    targetRequest("move.ip.prev", targetId);
}

} // namespace uai::client
