#pragma once

/**
 * AsioTcpTransport.hpp
 *
 * Boost.Asio 기반 IStreamTransport 구현 (헤더)
 *
 * 설계 요약:
 *  - 생성자에서는 io_context/소켓 생성까지만 수행(io thread는 open()에서 시작)
 *  - open(): resolve + async_connect 를 io thread에서 실행하고 제한 시간까지 대기
 *  - read(): 호출 스레드에서 blocking read_some. telnet 필터가 켜져 있으면 IAC 협상을 제거하고 거절 응답을 보냄
 *  - write()/flush(): 버퍼에 모았다가 flush()에서 동기 송신
 *  - close(): shutdown(both) 로 대기 중인 read()를 EOF로 깨움. 소켓 fd 해제는 다음 open() 또는 소멸자에서
 */

#include "IStreamTransport.hpp"

#include <memory>
#include <string>

namespace uai::comm {

class AsioTcpTransport : public IStreamTransport {
public:
    explicit AsioTcpTransport(bool telnet = true);
    ~AsioTcpTransport() override;

    AsioTcpTransport(const AsioTcpTransport&) = delete;
    AsioTcpTransport& operator=(const AsioTcpTransport&) = delete;

    void open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) override;
    std::string read(std::size_t maxBytes) override;
    void write(const std::string& data) override;
    void flush() override;
    void close() override;
    bool isOpen() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace uai::comm
