/*
 * 설명: UI 명령 계층이 호출하는 엔진 API. 연결 레지스트리, 스크롤백 저장소, 서버 프로필 저장소를 묶는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/engine_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "client/event_sink.hpp"
#include "client/registry.hpp"
#include "client/types.hpp"
#include "storage/config_store.hpp"
#include "storage/scrollback_store.hpp"
#include "utils/logger.hpp"

namespace client {

class Engine {
   public:
    Engine(const std::shared_ptr<EventSink> &sink,
           const std::shared_ptr<storage::ScrollbackStore> &scrollback,
           const std::shared_ptr<storage::ConfigStore> &config_store,
           const std::shared_ptr<Logger> &logger);

    // 프로필을 먼저 저장한 뒤 연결한다. 저장 실패는 error로 돌려준다.
    bool Connect(const ConnectionConfig &config, std::string &id, std::string &error);
    RouteStatus Disconnect(const std::string &id);
    RouteStatus Disconnect(const std::string &id, const std::string &reason);
    RouteStatus Join(const std::string &id, const std::string &channel);
    RouteStatus Part(const std::string &id, const std::string &channel);
    RouteStatus Part(const std::string &id, const std::string &channel, const std::string &reason);
    RouteStatus SendMessage(const std::string &id, const std::string &target,
                            const std::string &message);
    RouteStatus SetTopic(const std::string &id, const std::string &channel);
    RouteStatus SetTopic(const std::string &id, const std::string &channel,
                         const std::string &topic);

    bool Scrollback(const std::string &id, const std::string &target,
                    std::vector<ChatMessage> &out, std::string &error);
    bool Scrollback(const std::string &id, const std::string &target, std::size_t limit,
                    std::vector<ChatMessage> &out, std::string &error);

    std::vector<std::string> ListConnections();
    std::vector<ConnectionConfig> SavedConnections() const;

    void Shutdown();

   private:
    bool ResolveStorageKey(const std::string &id, std::string &storage_key, std::string &error);

    std::shared_ptr<storage::ScrollbackStore> scrollback_;
    std::shared_ptr<storage::ConfigStore> config_store_;
    std::shared_ptr<Logger> logger_;
    ConnectionRegistry registry_;
};

}  // namespace client
