#pragma once
/**
 * UaiClient.hpp
 *
 * Somfy UAI+ command API on top of one Connection.
 *
 * Every call is a single request/reply:
 *  - status.info / status.position / group.get : queries, decoded into typed results
 *  - move.*                                     : motor commands, result ignored
 *
 * Errors are ClientException (NotReady, ErrorResponse, ConnectionClosed, ...);
 * a reply whose result does not have the expected shape is ProtocolViolation.
 */

#include "Connection.hpp"

#include <memory>
#include <string>
#include <vector>

namespace uai::client {

struct TargetInfo {
    std::string name;
    std::string type;
};

struct GroupInfo {
    std::string name;
};

class UaiClient {
public:
    using ReadyHandler = Connection::ReadyHandler;
    using DisconnectedHandler = Connection::DisconnectedHandler;

    explicit UaiClient(uai::config::ConnectionSettings settings,
                       ReadyHandler onReady = nullptr,
                       DisconnectedHandler onDisconnected = nullptr,
                       Connection::TransportFactory transportFactory = nullptr);

    UaiClient(const UaiClient&) = delete;
    UaiClient& operator=(const UaiClient&) = delete;

    // connect and wait for the login to finish
    void connect();
    void disconnect();
    bool isConnected() const noexcept;

    Connection& connection() noexcept { return *connection_; }

    // queries
    TargetInfo getTargetInfo(const std::string& targetId);
    // 0 = fully open, 100 = fully closed
    int getTargetPosition(const std::string& targetId);
    std::vector<std::string> getGroupsForTarget(const std::string& targetId);
    GroupInfo getGroupInfo(const std::string& groupId);

    // movement
    void moveUp(const std::string& targetId);
    void moveDown(const std::string& targetId);
    void stop(const std::string& targetId);
    void moveTo(const std::string& targetId, int position);
    void moveToIntermediatePosition(const std::string& targetId, int intermediatePosition);
    void moveToNextIntermediatePosition(const std::string& targetId);
    void moveToPreviousIntermediatePosition(const std::string& targetId);

private:
    nlohmann::json targetRequest(const std::string& method, const std::string& targetId,
                                 nlohmann::json extra = nlohmann::json::object());

    std::unique_ptr<Connection> connection_;
};

} // namespace uai::client
