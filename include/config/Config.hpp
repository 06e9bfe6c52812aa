#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace uai::config {

using ms = std::chrono::milliseconds;

// UAI+ telnet 포트
constexpr std::uint16_t DEFAULT_TELNET_PORT = 23;

// 연결 수립 제한 시간 (로그인 협상은 포함하지 않음)
constexpr ms DEFAULT_CONNECT_TIMEOUT_MS = ms(5000);

// read loop 1회 최대 읽기 크기
constexpr std::size_t DEFAULT_READ_CHUNK = 1024;

// 로그인 프롬프트 / 배너 (줄바꿈 단위가 아님)
constexpr char USER_PROMPT[] = "User:";
constexpr char PASSWORD_PROMPT[] = "Password:";
// 배너 끝의 NUL 까지 포함해서 소비해야 함
constexpr char CONNECTED_BANNER[] = "Connected:\n";
constexpr std::size_t CONNECTED_BANNER_SIZE = sizeof(CONNECTED_BANNER); // trailing '\0' included

// 요청 줄 종료 문자
constexpr char REQUEST_TERMINATOR = '\r';

struct ConnectionSettings {
    std::string host;
    std::uint16_t port{DEFAULT_TELNET_PORT};
    std::string user;
    std::string password;
    ms connectTimeout{DEFAULT_CONNECT_TIMEOUT_MS};
    // false: raw TCP stream, telnet option negotiation is not filtered
    bool telnet{true};
};

} // namespace uai::config
