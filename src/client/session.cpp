/*
 * 설명: 세션 스레드 본체. 연결/등록 후 수신 라인과 명령 큐 중 먼저 준비된 쪽을 처리하고,
 *       채팅 이벤트는 스크롤백에 기록한 뒤 UI로 내보낸다. 세션당 Disconnected는 정확히 한 번이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_test.cpp
 */
#include "client/session.hpp"

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <vector>

#include "protocol/commands.hpp"
#include "protocol/framer.hpp"

namespace client {

std::string SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::kConnecting:
            return "connecting";
        case SessionState::kHandshaking:
            return "handshaking";
        case SessionState::kReady:
            return "ready";
        case SessionState::kClosing:
            return "closing";
        case SessionState::kClosed:
            return "closed";
    }
    return "closed";
}

Session::Session(const std::string &id, const ConnectionConfig &config,
                 const std::shared_ptr<CommandInbox> &inbox,
                 const std::shared_ptr<EventSink> &sink,
                 const std::shared_ptr<storage::ScrollbackStore> &scrollback,
                 const std::shared_ptr<Logger> &logger)
    : id_(id),
      config_(config),
      storage_key_(config.StorageKey()),
      inbox_(inbox),
      sink_(sink),
      scrollback_(scrollback),
      logger_(logger),
      last_timestamp_(0),
      reached_ready_(false),
      state_(SessionState::kConnecting),
      disconnect_announced_(false),
      finished_(false) {}

void Session::Run() {
    try {
        if (Connect() && Handshake()) {
            Loop();
        }
    } catch (const std::exception &ex) {
        logger_->Error(Describe(std::string("세션 예외: ") + ex.what()));
        Emit(IrcEvent::Error(id_, ex.what()));
    }
    Finish();
}

bool Session::ClaimDisconnectAnnouncement() {
    bool expected = false;
    return disconnect_announced_.compare_exchange_strong(expected, true);
}

bool Session::Connect() {
    state_ = SessionState::kConnecting;
    logger_->Info(Describe("연결 시도"));

    std::string error;
    if (!OpenTransport(config_.server, config_.port, config_.use_tls, transport_, error)) {
        logger_->Error(Describe("연결 실패: " + error));
        Emit(IrcEvent::Error(id_, "failed to connect: " + error));
        return false;
    }
    logger_->Info(Describe(config_.use_tls ? "TLS 연결 성립" : "TCP 연결 성립"));
    return true;
}

bool Session::Handshake() {
    state_ = SessionState::kHandshaking;

    std::vector<std::string> lines;
    if (!config_.password.empty()) {
        lines.push_back(protocol::BuildPass(config_.password));
    }
    lines.push_back(protocol::BuildNick(config_.nickname));
    lines.push_back(protocol::BuildUser(config_.EffectiveUsername(), config_.EffectiveRealname()));

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string error;
        if (!WriteLine(lines[i], error)) {
            logger_->Error(Describe("등록 실패: " + error));
            Emit(IrcEvent::Error(id_, "handshake failed: " + error));
            return false;
        }
    }

    // 001을 기다리지 않고 바로 Ready로 넘어간다.
    state_ = SessionState::kReady;
    reached_ready_ = true;
    logger_->Info(Describe("등록 라인 전송 완료"));
    Emit(IrcEvent::Connected(id_, config_.nickname, config_.server, "connected"));
    return true;
}

void Session::Loop() {
    struct pollfd fds[2];
    fds[0].fd = transport_->fd();
    fds[0].events = POLLIN;
    fds[1].fd = inbox_->wake_fd();
    fds[1].events = POLLIN;

    while (true) {
        fds[0].revents = 0;
        fds[1].revents = 0;

        int timeout = transport_->HasBufferedData() ? 0 : -1;
        int ret = poll(fds, 2, timeout);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string error = std::strerror(errno);
            logger_->Error(Describe("poll 실패: " + error));
            CloseWithReason("read error: " + error);
            return;
        }

        if (transport_->HasBufferedData() || (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            if (!PumpInbound()) {
                return;
            }
        }
        if (fds[1].revents & POLLIN) {
            if (!PumpInbox()) {
                return;
            }
        }
    }
}

bool Session::PumpInbound() {
    std::string error;
    switch (transport_->Read(input_buffer_, error)) {
        case ReadStatus::kData: {
            std::vector<std::string> lines = protocol::ExtractLines(input_buffer_);
            for (std::size_t i = 0; i < lines.size(); ++i) {
                HandleLine(lines[i]);
            }
            return true;
        }
        case ReadStatus::kWouldBlock:
            return true;
        case ReadStatus::kEof: {
            std::string last;
            if (protocol::ExtractFinalLine(input_buffer_, last)) {
                HandleLine(last);
            }
            logger_->Info(Describe("서버가 연결을 닫음"));
            CloseWithReason("connection closed");
            return false;
        }
        case ReadStatus::kError:
            logger_->Error(Describe("수신 오류: " + error));
            CloseWithReason("read error: " + error);
            return false;
    }
    return true;
}

bool Session::PumpInbox() {
    inbox_->DrainWakeups();
    ConnectionCommand command;
    while (inbox_->TryReceive(command)) {
        if (!HandleCommand(command)) {
            return false;
        }
    }
    return true;
}

void Session::Finish() {
    inbox_->Close();
    transport_.reset();
    if (reached_ready_) {
        // 어떤 경로로 끝나든 Disconnected는 한 번은 나간다.
        EmitDisconnected(true, "connection closed");
    }
    state_ = SessionState::kClosed;
    logger_->Info(Describe("세션 종료"));
    finished_ = true;
}

void Session::HandleLine(const std::string &line) {
    logger_->Debug(Describe("<< " + line));
    protocol::ParsedMessage msg = protocol::ParseMessageLine(line);

    if (msg.command == "PING") {
        HandlePing(msg);
        return;
    }
    if (msg.command == "001") {
        HandleWelcome();
        return;
    }
    if (msg.command == "353") {
        HandleNames(msg);
        return;
    }
    if (msg.command == "332") {
        HandleTopicReply(msg);
        return;
    }
    if (msg.command == "PRIVMSG") {
        HandlePrivmsg(msg);
        return;
    }
    if (msg.command == "NOTICE") {
        HandleNotice(msg);
        return;
    }
    if (msg.command == "JOIN") {
        HandleJoin(msg);
        return;
    }
    if (msg.command == "PART") {
        HandlePart(msg);
        return;
    }
    if (msg.command == "QUIT") {
        HandleQuit(msg);
        return;
    }
    if (msg.command == "433") {
        Emit(IrcEvent::Error(id_, "nickname already in use"));
        return;
    }
}

void Session::HandlePing(const protocol::ParsedMessage &msg) {
    if (!msg.params.empty()) {
        WriteOrWarn(protocol::BuildPong(msg.params[0]));
    } else if (msg.has_trailing) {
        WriteOrWarn(protocol::BuildPong(msg.trailing));
    }
}

void Session::HandleWelcome() {
    Emit(IrcEvent::Connected(id_, config_.nickname, config_.server, "welcome"));
    for (std::size_t i = 0; i < config_.auto_join.size(); ++i) {
        WriteOrWarn(protocol::BuildJoin(config_.auto_join[i]));
    }
}

void Session::HandleNames(const protocol::ParsedMessage &msg) {
    if (msg.params.size() < 3) {
        return;
    }
    Emit(IrcEvent::Names(id_, msg.params[2], protocol::DecodeNameList(msg.trailing)));
}

void Session::HandleTopicReply(const protocol::ParsedMessage &msg) {
    if (msg.params.size() < 2) {
        return;
    }
    const std::string &channel = msg.params[1];
    Emit(IrcEvent::Topic(id_, channel, msg.trailing));
    Record(NewMessage(channel, MessageKind::kTopic, "Topic: " + msg.trailing));
}

void Session::HandlePrivmsg(const protocol::ParsedMessage &msg) {
    if (msg.params.empty()) {
        return;
    }

    std::string text;
    if (msg.has_trailing) {
        text = msg.trailing;
    } else if (msg.params.size() > 1) {
        text = msg.params[1];
    }

    MessageKind kind = MessageKind::kPrivmsg;
    std::string action;
    if (protocol::DecodeCtcpAction(text, action)) {
        text = action;
        kind = MessageKind::kAction;
    }

    ChatMessage message = NewMessage(msg.params[0], kind, text);
    std::string sender;
    if (msg.has_prefix && protocol::ExtractNick(msg.prefix, sender)) {
        message.sender = sender;
        message.has_sender = true;
        // 나에게 온 개인 메시지는 보낸 사람 이름으로 분류한다.
        if (protocol::EqualsIgnoreCase(message.target, config_.nickname)) {
            message.target = sender;
        }
    }
    Record(message);
}

void Session::HandleNotice(const protocol::ParsedMessage &msg) {
    if (msg.params.empty()) {
        return;
    }

    std::string text;
    if (msg.has_trailing) {
        text = msg.trailing;
    } else if (msg.params.size() > 1) {
        text = msg.params[1];
    }

    ChatMessage message = NewMessage(msg.params[0], MessageKind::kNotice, text);
    std::string sender;
    if (msg.has_prefix && protocol::ExtractNick(msg.prefix, sender)) {
        message.sender = sender;
        message.has_sender = true;
    }
    Record(message);
}

void Session::HandleJoin(const protocol::ParsedMessage &msg) {
    std::string channel;
    if (!msg.params.empty()) {
        channel = msg.params[0];
    } else if (msg.has_trailing) {
        channel = msg.trailing;
    }
    std::string nick = SenderNick(msg);

    ChatMessage message = NewMessage(channel, MessageKind::kJoin, nick + " joined " + channel);
    message.sender = nick;
    message.has_sender = true;
    Record(message);
}

void Session::HandlePart(const protocol::ParsedMessage &msg) {
    if (msg.params.empty()) {
        return;
    }
    const std::string &channel = msg.params[0];
    std::string nick = SenderNick(msg);

    std::string reason;
    if (msg.params.size() > 1) {
        reason = msg.params[1];
    } else if (msg.has_trailing) {
        reason = msg.trailing;
    }

    std::string text = nick + " left " + channel;
    if (!reason.empty()) {
        text += " (" + reason + ")";
    }
    ChatMessage message = NewMessage(channel, MessageKind::kPart, text);
    message.sender = nick;
    message.has_sender = true;
    Record(message);
}

void Session::HandleQuit(const protocol::ParsedMessage &msg) {
    std::string nick = SenderNick(msg);

    std::string reason;
    if (!msg.params.empty()) {
        reason = msg.params[0];
    } else if (msg.has_trailing) {
        reason = msg.trailing;
    }

    std::string text = reason.empty() ? nick + " quit" : nick + " quit: " + reason;
    ChatMessage message = NewMessage(nick, MessageKind::kQuit, text);
    message.sender = nick;
    message.has_sender = true;
    Record(message);
}

bool Session::HandleCommand(const ConnectionCommand &command) {
    switch (command.type) {
        case CommandType::kJoin:
            WriteOrWarn(protocol::BuildJoin(command.target));
            break;
        case CommandType::kPart:
            WriteOrWarn(command.has_text ? protocol::BuildPart(command.target, command.text)
                                         : protocol::BuildPart(command.target));
            break;
        case CommandType::kPrivmsg: {
            WriteOrWarn(protocol::BuildPrivmsg(command.target, command.text));
            // 서버는 내 PRIVMSG를 되돌려주지 않으므로 직접 기록한다.
            ChatMessage echo = NewMessage(command.target, MessageKind::kPrivmsg, command.text);
            echo.sender = config_.nickname;
            echo.has_sender = true;
            Record(echo);
            break;
        }
        case CommandType::kTopic:
            WriteOrWarn(command.has_text ? protocol::BuildTopic(command.target, command.text)
                                         : protocol::BuildTopic(command.target));
            break;
        case CommandType::kQuit: {
            state_ = SessionState::kClosing;
            std::string error;
            if (!WriteLine(command.has_text ? protocol::BuildQuit(command.text)
                                            : protocol::BuildQuit(),
                           error)) {
                logger_->Debug(Describe("QUIT 전송 실패: " + error));
            }
            EmitDisconnected(command.has_text, command.text);
            return false;
        }
    }
    return true;
}

bool Session::WriteLine(const std::string &line, std::string &error) {
    logger_->Debug(Describe(">> " + line));
    return transport_->WriteAll(protocol::TerminateLine(line), error);
}

void Session::WriteOrWarn(const std::string &line) {
    std::string error;
    if (!WriteLine(line, error)) {
        logger_->Warn(Describe("송신 실패: " + error));
    }
}

void Session::Record(const ChatMessage &message) {
    std::string error;
    if (!scrollback_->Append(storage_key_, message, error)) {
        logger_->Warn(Describe("스크롤백 기록 실패: " + error));
    }
    Emit(IrcEvent::Message(message));
}

void Session::Emit(const IrcEvent &event) { sink_->Emit(kEventTopic, event); }

void Session::EmitDisconnected(bool has_reason, const std::string &reason) {
    if (!ClaimDisconnectAnnouncement()) {
        return;
    }
    Emit(has_reason ? IrcEvent::Disconnected(id_, reason) : IrcEvent::Disconnected(id_));
}

void Session::CloseWithReason(const std::string &reason) {
    state_ = SessionState::kClosing;
    EmitDisconnected(true, reason);
}

ChatMessage Session::NewMessage(const std::string &target, MessageKind kind,
                                const std::string &text) {
    ChatMessage message;
    message.connection_id = id_;
    message.target = target;
    message.message = text;
    message.kind = kind;
    message.timestamp = NextTimestamp();
    return message;
}

std::string Session::SenderNick(const protocol::ParsedMessage &msg) const {
    std::string nick;
    if (msg.has_prefix && protocol::ExtractNick(msg.prefix, nick)) {
        return nick;
    }
    return config_.nickname;
}

long long Session::NextTimestamp() {
    long long now = CurrentTimestampMillis();
    if (now < last_timestamp_) {
        now = last_timestamp_;
    }
    last_timestamp_ = now;
    return now;
}

std::string Session::Describe(const std::string &what) const {
    return "[" + id_ + " " + storage_key_ + " " + SessionStateToString(state_.load()) + "] " +
           what;
}

}  // namespace client
