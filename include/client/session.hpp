/*
 * 설명: 연결 하나의 Connecting → Handshaking → Ready → Closing → Closed 수명 주기를 전용 스레드에서 실행한다.
 *       소켓과 명령 큐를 함께 poll하며, 소켓에 쓰는 주체는 이 세션뿐이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "client/command_inbox.hpp"
#include "client/event_sink.hpp"
#include "client/transport.hpp"
#include "client/types.hpp"
#include "protocol/message.hpp"
#include "storage/scrollback_store.hpp"
#include "utils/logger.hpp"

namespace client {

enum class SessionState { kConnecting, kHandshaking, kReady, kClosing, kClosed };

std::string SessionStateToString(SessionState state);

class Session {
   public:
    Session(const std::string &id, const ConnectionConfig &config,
            const std::shared_ptr<CommandInbox> &inbox, const std::shared_ptr<EventSink> &sink,
            const std::shared_ptr<storage::ScrollbackStore> &scrollback,
            const std::shared_ptr<Logger> &logger);

    // 세션 스레드의 진입점. Closed에 도달하면 반환한다.
    void Run();

    // Disconnected 이벤트를 낼 권리를 한 번만 내준다. 세션과 레지스트리가 공유한다.
    bool ClaimDisconnectAnnouncement();

    const std::string &id() const { return id_; }
    const std::string &storage_key() const { return storage_key_; }
    SessionState state() const { return state_.load(); }
    bool finished() const { return finished_.load(); }

   private:
    Session(const Session &);
    Session &operator=(const Session &);

    bool Connect();
    bool Handshake();
    void Loop();
    bool PumpInbound();
    bool PumpInbox();
    void Finish();

    void HandleLine(const std::string &line);
    void HandlePing(const protocol::ParsedMessage &msg);
    void HandleWelcome();
    void HandleNames(const protocol::ParsedMessage &msg);
    void HandleTopicReply(const protocol::ParsedMessage &msg);
    void HandlePrivmsg(const protocol::ParsedMessage &msg);
    void HandleNotice(const protocol::ParsedMessage &msg);
    void HandleJoin(const protocol::ParsedMessage &msg);
    void HandlePart(const protocol::ParsedMessage &msg);
    void HandleQuit(const protocol::ParsedMessage &msg);
    bool HandleCommand(const ConnectionCommand &command);

    bool WriteLine(const std::string &line, std::string &error);
    void WriteOrWarn(const std::string &line);
    void Record(const ChatMessage &message);
    void Emit(const IrcEvent &event);
    void EmitDisconnected(bool has_reason, const std::string &reason);
    void CloseWithReason(const std::string &reason);
    ChatMessage NewMessage(const std::string &target, MessageKind kind,
                           const std::string &text);
    std::string SenderNick(const protocol::ParsedMessage &msg) const;
    long long NextTimestamp();
    std::string Describe(const std::string &what) const;

    const std::string id_;
    const ConnectionConfig config_;
    const std::string storage_key_;
    std::shared_ptr<CommandInbox> inbox_;
    std::shared_ptr<EventSink> sink_;
    std::shared_ptr<storage::ScrollbackStore> scrollback_;
    std::shared_ptr<Logger> logger_;

    std::unique_ptr<Transport> transport_;
    std::string input_buffer_;
    long long last_timestamp_;
    bool reached_ready_;

    std::atomic<SessionState> state_;
    std::atomic<bool> disconnect_announced_;
    std::atomic<bool> finished_;
};

}  // namespace client
