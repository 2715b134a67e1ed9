/*
 * 설명: 평문 TCP 또는 TLS 위의 바이트 스트림을 추상화한다. 읽기는 논블로킹, 쓰기는 전부 전송될 때까지 대기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp
 */
#pragma once

#include <memory>
#include <string>

namespace client {

enum class ReadStatus { kData, kWouldBlock, kEof, kError };

class Transport {
   public:
    virtual ~Transport() {}

    virtual int fd() const = 0;
    // 읽은 바이트를 out 뒤에 덧붙인다.
    virtual ReadStatus Read(std::string &out, std::string &error) = 0;
    virtual bool WriteAll(const std::string &data, std::string &error) = 0;
    // TLS 계층에 이미 복호화된 데이터가 남아 있으면 poll 없이 읽어야 한다.
    virtual bool HasBufferedData() const = 0;
};

// DNS 조회, TCP 연결, (use_tls이면) TLS 핸드셰이크까지 마친 전송 계층을 만든다.
bool OpenTransport(const std::string &host, int port, bool use_tls,
                   std::unique_ptr<Transport> &out, std::string &error);

}  // namespace client
