/*
 * 설명: 이벤트를 JSON 라인으로 출력하는 기본 EventSink 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/serialization_test.cpp
 */
#include "client/event_sink.hpp"

#include "client/serialization.hpp"

namespace client {

JsonLineEventSink::JsonLineEventSink(std::ostream &out) : out_(out) {}

void JsonLineEventSink::Emit(const std::string &topic, const IrcEvent &event) {
    std::string line = topic + " " + DumpJson(EventToJson(event));
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
}

}  // namespace client
