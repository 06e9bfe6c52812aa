#pragma once

/**
 * IStreamTransport.hpp
 *
 * 바이트 스트림 전송 추상 인터페이스
 *
 * 핵심 포인트:
 *  - open() : 연결 수립 (제한 시간 포함). 실패 시 ClientException(Timeout / Transport)
 *  - read() : blocking read. 빈 문자열 == EOF
 *  - write()/flush() : write()는 내부 버퍼에 쌓고 flush()가 실제 송신
 *  - close() : 스트림을 닫아 대기 중인 read()를 깨운다. 여러 번 호출해도 안전
 *
 * 설계 의도:
 *  - Connection은 read loop 스레드에서 read()를, 호출자 스레드에서 write()/flush()를 사용한다.
 *    write()/flush() 직렬화는 Connection 쪽 책임.
 *  - 테스트에서는 스크립트 기반 가짜 구현으로 교체한다.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace uai::comm {

class IStreamTransport {
public:
    virtual ~IStreamTransport() = default;

    /// 제한 시간 안에 host:port 로 연결. 실패 시 예외.
    virtual void open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) = 0;

    /**
     * 최대 maxBytes 만큼 읽는다. 데이터가 올 때까지 block.
     * - 빈 문자열은 EOF (close() 이후 포함)
     * - 소켓 오류는 ClientException(Transport)
     */
    virtual std::string read(std::size_t maxBytes) = 0;

    virtual void write(const std::string& data) = 0;
    virtual void flush() = 0;

    virtual void close() = 0;

    virtual bool isOpen() const noexcept = 0;
};

} // namespace uai::comm
