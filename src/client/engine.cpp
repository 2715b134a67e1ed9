/*
 * 설명: 엔진 API를 레지스트리와 저장소 호출로 연결한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/engine_test.cpp
 */
#include "client/engine.hpp"

namespace client {

Engine::Engine(const std::shared_ptr<EventSink> &sink,
               const std::shared_ptr<storage::ScrollbackStore> &scrollback,
               const std::shared_ptr<storage::ConfigStore> &config_store,
               const std::shared_ptr<Logger> &logger)
    : scrollback_(scrollback),
      config_store_(config_store),
      logger_(logger),
      registry_(sink, scrollback, logger) {}

bool Engine::Connect(const ConnectionConfig &config, std::string &id, std::string &error) {
    if (!config_store_->Upsert(config, error)) {
        logger_->Error("프로필 저장 실패: " + error);
        return false;
    }
    id = registry_.Connect(config);
    return true;
}

RouteStatus Engine::Disconnect(const std::string &id) { return registry_.Disconnect(id); }

RouteStatus Engine::Disconnect(const std::string &id, const std::string &reason) {
    return registry_.Disconnect(id, reason);
}

RouteStatus Engine::Join(const std::string &id, const std::string &channel) {
    return registry_.Join(id, channel);
}

RouteStatus Engine::Part(const std::string &id, const std::string &channel) {
    return registry_.Part(id, channel);
}

RouteStatus Engine::Part(const std::string &id, const std::string &channel,
                         const std::string &reason) {
    return registry_.Part(id, channel, reason);
}

RouteStatus Engine::SendMessage(const std::string &id, const std::string &target,
                                const std::string &message) {
    return registry_.Privmsg(id, target, message);
}

RouteStatus Engine::SetTopic(const std::string &id, const std::string &channel) {
    return registry_.SetTopic(id, channel);
}

RouteStatus Engine::SetTopic(const std::string &id, const std::string &channel,
                             const std::string &topic) {
    return registry_.SetTopic(id, channel, topic);
}

bool Engine::Scrollback(const std::string &id, const std::string &target,
                        std::vector<ChatMessage> &out, std::string &error) {
    std::string storage_key;
    if (!ResolveStorageKey(id, storage_key, error)) {
        return false;
    }
    return scrollback_->ReadLast(storage_key, target, out, error);
}

bool Engine::Scrollback(const std::string &id, const std::string &target, std::size_t limit,
                        std::vector<ChatMessage> &out, std::string &error) {
    std::string storage_key;
    if (!ResolveStorageKey(id, storage_key, error)) {
        return false;
    }
    return scrollback_->ReadLast(storage_key, target, limit, out, error);
}

std::vector<std::string> Engine::ListConnections() { return registry_.List(); }

std::vector<ConnectionConfig> Engine::SavedConnections() const { return config_store_->List(); }

void Engine::Shutdown() { registry_.Shutdown(); }

bool Engine::ResolveStorageKey(const std::string &id, std::string &storage_key,
                               std::string &error) {
    ConnectionHandle handle;
    if (!registry_.Get(id, handle)) {
        error = RouteStatusToString(RouteStatus::kNotFound);
        return false;
    }
    storage_key = handle.storage_key();
    return true;
}

}  // namespace client
