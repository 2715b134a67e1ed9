/*
 * 설명: 세션이 UI 계층으로 이벤트를 내보내는 출구를 정의한다. Emit은 호출자를 막지 않아야 하며 결과를 돌려주지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp, tests/unit/serialization_test.cpp
 */
#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include "client/types.hpp"

namespace client {

class EventSink {
   public:
    virtual ~EventSink() {}
    virtual void Emit(const std::string &topic, const IrcEvent &event) = 0;
};

// 이벤트마다 "<topic> <json>" 한 줄을 출력한다.
class JsonLineEventSink : public EventSink {
   public:
    explicit JsonLineEventSink(std::ostream &out);
    void Emit(const std::string &topic, const IrcEvent &event);

   private:
    std::mutex mutex_;
    std::ostream &out_;
};

}  // namespace client
