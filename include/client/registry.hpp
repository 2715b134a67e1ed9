/*
 * 설명: 프로세스 전체의 연결 표. 연결 ID로 핸들을 찾아 명령을 전달하고, server:port:nickname이 같은 연결은 다시 만들지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/registry_test.cpp
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "client/command_inbox.hpp"
#include "client/event_sink.hpp"
#include "client/session.hpp"
#include "client/types.hpp"
#include "storage/scrollback_store.hpp"
#include "utils/logger.hpp"

namespace client {

enum class RouteStatus { kOk = 0, kNotFound = 1, kChannelClosed = 2 };

std::string RouteStatusToString(RouteStatus status);

class ConnectionHandle {
   public:
    ConnectionHandle();
    ConnectionHandle(const std::string &id, const std::string &storage_key,
                     const std::shared_ptr<CommandInbox> &inbox,
                     const std::shared_ptr<Session> &session);

    const std::string &id() const { return id_; }
    const std::string &storage_key() const { return storage_key_; }
    RouteStatus SendCommand(const ConnectionCommand &command) const;
    bool IsTerminated() const;
    bool ClaimDisconnectAnnouncement() const;

   private:
    std::string id_;
    std::string storage_key_;
    std::shared_ptr<CommandInbox> inbox_;
    std::shared_ptr<Session> session_;
};

class ConnectionRegistry {
   public:
    ConnectionRegistry(const std::shared_ptr<EventSink> &sink,
                       const std::shared_ptr<storage::ScrollbackStore> &scrollback,
                       const std::shared_ptr<Logger> &logger);
    ~ConnectionRegistry();

    // 같은 식별 키의 살아 있는 연결이 있으면 그 ID를 돌려준다. 핸드셰이크를 기다리지 않는다.
    std::string Connect(const ConnectionConfig &config);
    RouteStatus Disconnect(const std::string &id);
    RouteStatus Disconnect(const std::string &id, const std::string &reason);

    RouteStatus Join(const std::string &id, const std::string &channel);
    RouteStatus Part(const std::string &id, const std::string &channel);
    RouteStatus Part(const std::string &id, const std::string &channel, const std::string &reason);
    RouteStatus Privmsg(const std::string &id, const std::string &target,
                        const std::string &message);
    RouteStatus SetTopic(const std::string &id, const std::string &channel);
    RouteStatus SetTopic(const std::string &id, const std::string &channel,
                         const std::string &topic);

    std::vector<std::string> List();
    bool Get(const std::string &id, ConnectionHandle &out);
    bool FindByConfig(const ConnectionConfig &config, ConnectionHandle &out);

    // 모든 세션에 QUIT을 보내고 스레드가 끝날 때까지 기다린다.
    void Shutdown();

   private:
    struct Worker {
        std::shared_ptr<Session> session;
        std::thread thread;
    };

    ConnectionRegistry(const ConnectionRegistry &);
    ConnectionRegistry &operator=(const ConnectionRegistry &);

    RouteStatus Forward(const std::string &id, const ConnectionCommand &command);
    RouteStatus DisconnectWith(const std::string &id, const ConnectionCommand &quit);
    bool FindByKeyLocked(const std::string &storage_key, ConnectionHandle &out) const;
    void ReapLocked();
    std::string GenerateIdLocked();

    std::shared_ptr<EventSink> sink_;
    std::shared_ptr<storage::ScrollbackStore> scrollback_;
    std::shared_ptr<Logger> logger_;

    std::mutex mutex_;
    std::map<std::string, ConnectionHandle> connections_;
    std::map<std::string, Worker> workers_;
    std::mt19937_64 rng_;
};

}  // namespace client
