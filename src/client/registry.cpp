/*
 * 설명: 연결 표의 추가/조회/제거와 명령 전달을 구현한다. 잠금 구간은 표 조작에만 쓰고 소켓 I/O는 하지 않는다.
 *       끝난 세션의 핸들은 다음 표 접근 시 제거되며, 그 스레드도 함께 join된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/registry_test.cpp
 */
#include "client/registry.hpp"

#include <cstdio>
#include <utility>

namespace client {

std::string RouteStatusToString(RouteStatus status) {
    switch (status) {
        case RouteStatus::kOk:
            return "ok";
        case RouteStatus::kNotFound:
            return "connection not found";
        case RouteStatus::kChannelClosed:
            return "connection channel closed";
    }
    return "connection not found";
}

ConnectionHandle::ConnectionHandle() {}

ConnectionHandle::ConnectionHandle(const std::string &id, const std::string &storage_key,
                                   const std::shared_ptr<CommandInbox> &inbox,
                                   const std::shared_ptr<Session> &session)
    : id_(id), storage_key_(storage_key), inbox_(inbox), session_(session) {}

RouteStatus ConnectionHandle::SendCommand(const ConnectionCommand &command) const {
    if (!inbox_ || !inbox_->Send(command)) {
        return RouteStatus::kChannelClosed;
    }
    return RouteStatus::kOk;
}

bool ConnectionHandle::IsTerminated() const { return !inbox_ || inbox_->IsClosed(); }

bool ConnectionHandle::ClaimDisconnectAnnouncement() const {
    return session_ && session_->ClaimDisconnectAnnouncement();
}

ConnectionRegistry::ConnectionRegistry(const std::shared_ptr<EventSink> &sink,
                                       const std::shared_ptr<storage::ScrollbackStore> &scrollback,
                                       const std::shared_ptr<Logger> &logger)
    : sink_(sink), scrollback_(scrollback), logger_(logger), rng_(std::random_device()()) {}

ConnectionRegistry::~ConnectionRegistry() { Shutdown(); }

std::string ConnectionRegistry::Connect(const ConnectionConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReapLocked();

    const std::string storage_key = config.StorageKey();
    ConnectionHandle existing;
    if (FindByKeyLocked(storage_key, existing)) {
        logger_->Info("이미 연결됨: " + storage_key + " -> " + existing.id());
        return existing.id();
    }

    const std::string id = GenerateIdLocked();
    std::shared_ptr<CommandInbox> inbox(new CommandInbox());
    std::shared_ptr<Session> session(
        new Session(id, config, inbox, sink_, scrollback_, logger_));

    std::thread thread(&Session::Run, session);
    Worker &worker = workers_[id];
    worker.session = session;
    worker.thread = std::move(thread);
    connections_[id] = ConnectionHandle(id, storage_key, inbox, session);

    logger_->Info("연결 등록: " + storage_key + " -> " + id);
    return id;
}

RouteStatus ConnectionRegistry::Disconnect(const std::string &id) {
    return DisconnectWith(id, ConnectionCommand::Quit());
}

RouteStatus ConnectionRegistry::Disconnect(const std::string &id, const std::string &reason) {
    return DisconnectWith(id, ConnectionCommand::Quit(reason));
}

RouteStatus ConnectionRegistry::DisconnectWith(const std::string &id,
                                               const ConnectionCommand &quit) {
    ConnectionHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ReapLocked();
        std::map<std::string, ConnectionHandle>::iterator it = connections_.find(id);
        if (it == connections_.end()) {
            return RouteStatus::kNotFound;
        }
        handle = it->second;
        connections_.erase(it);
    }

    logger_->Info("연결 해제 요청: " + id);
    RouteStatus status = handle.SendCommand(quit);
    if (handle.ClaimDisconnectAnnouncement()) {
        sink_->Emit(kEventTopic, quit.has_text ? IrcEvent::Disconnected(id, quit.text)
                                               : IrcEvent::Disconnected(id));
    }
    return status;
}

RouteStatus ConnectionRegistry::Join(const std::string &id, const std::string &channel) {
    return Forward(id, ConnectionCommand::Join(channel));
}

RouteStatus ConnectionRegistry::Part(const std::string &id, const std::string &channel) {
    return Forward(id, ConnectionCommand::Part(channel));
}

RouteStatus ConnectionRegistry::Part(const std::string &id, const std::string &channel,
                                     const std::string &reason) {
    return Forward(id, ConnectionCommand::Part(channel, reason));
}

RouteStatus ConnectionRegistry::Privmsg(const std::string &id, const std::string &target,
                                        const std::string &message) {
    return Forward(id, ConnectionCommand::Privmsg(target, message));
}

RouteStatus ConnectionRegistry::SetTopic(const std::string &id, const std::string &channel) {
    return Forward(id, ConnectionCommand::Topic(channel));
}

RouteStatus ConnectionRegistry::SetTopic(const std::string &id, const std::string &channel,
                                         const std::string &topic) {
    return Forward(id, ConnectionCommand::Topic(channel, topic));
}

std::vector<std::string> ConnectionRegistry::List() {
    std::lock_guard<std::mutex> lock(mutex_);
    ReapLocked();
    std::vector<std::string> ids;
    for (std::map<std::string, ConnectionHandle>::const_iterator it = connections_.begin();
         it != connections_.end(); ++it) {
        ids.push_back(it->first);
    }
    return ids;
}

bool ConnectionRegistry::Get(const std::string &id, ConnectionHandle &out) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReapLocked();
    std::map<std::string, ConnectionHandle>::const_iterator it = connections_.find(id);
    if (it == connections_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

bool ConnectionRegistry::FindByConfig(const ConnectionConfig &config, ConnectionHandle &out) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReapLocked();
    return FindByKeyLocked(config.StorageKey(), out);
}

void ConnectionRegistry::Shutdown() {
    std::map<std::string, ConnectionHandle> live;
    std::map<std::string, Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live.swap(connections_);
        workers.swap(workers_);
    }

    for (std::map<std::string, ConnectionHandle>::iterator it = live.begin(); it != live.end();
         ++it) {
        RouteStatus status = it->second.SendCommand(ConnectionCommand::Quit());
        if (status != RouteStatus::kOk) {
            logger_->Debug("종료 중 QUIT 전달 불가: " + it->first);
        }
    }
    for (std::map<std::string, Worker>::iterator it = workers.begin(); it != workers.end(); ++it) {
        if (it->second.thread.joinable()) {
            it->second.thread.join();
        }
    }
}

RouteStatus ConnectionRegistry::Forward(const std::string &id, const ConnectionCommand &command) {
    ConnectionHandle handle;
    if (!Get(id, handle)) {
        return RouteStatus::kNotFound;
    }
    return handle.SendCommand(command);
}

bool ConnectionRegistry::FindByKeyLocked(const std::string &storage_key,
                                         ConnectionHandle &out) const {
    for (std::map<std::string, ConnectionHandle>::const_iterator it = connections_.begin();
         it != connections_.end(); ++it) {
        if (it->second.storage_key() == storage_key && !it->second.IsTerminated()) {
            out = it->second;
            return true;
        }
    }
    return false;
}

void ConnectionRegistry::ReapLocked() {
    std::map<std::string, ConnectionHandle>::iterator conn = connections_.begin();
    while (conn != connections_.end()) {
        if (conn->second.IsTerminated()) {
            logger_->Info("종료된 연결 정리: " + conn->first);
            connections_.erase(conn++);
        } else {
            ++conn;
        }
    }

    // finished는 Run의 마지막 문장에서 세워지므로 join은 곧바로 끝난다.
    std::map<std::string, Worker>::iterator worker = workers_.begin();
    while (worker != workers_.end()) {
        if (worker->second.session->finished()) {
            if (worker->second.thread.joinable()) {
                worker->second.thread.join();
            }
            workers_.erase(worker++);
        } else {
            ++worker;
        }
    }
}

std::string ConnectionRegistry::GenerateIdLocked() {
    // RFC 4122 버전 4 형식
    unsigned char bytes[16];
    for (std::size_t i = 0; i < sizeof(bytes); i += 8) {
        unsigned long long value = rng_();
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<unsigned char>(value >> (j * 8));
        }
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    char text[37];
    std::snprintf(text, sizeof(text),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", bytes[0],
                  bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7], bytes[8],
                  bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);

    std::string id(text);
    if (workers_.count(id) != 0 || connections_.count(id) != 0) {
        return GenerateIdLocked();
    }
    return id;
}

}  // namespace client
