/*
 * 설명: 세션 하나가 소비하는 무제한 명령 큐. 송신은 절대 막히지 않으며, 깨움용 파이프로 소켓과 함께 poll할 수 있다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/command_inbox_test.cpp
 */
#pragma once

#include <deque>
#include <mutex>

#include "client/types.hpp"

namespace client {

class CommandInbox {
   public:
    CommandInbox();
    ~CommandInbox();

    // 수신 측이 닫혔으면 false를 돌려준다.
    bool Send(const ConnectionCommand &command);
    bool TryReceive(ConnectionCommand &out);
    void DrainWakeups();
    void Close();
    bool IsClosed() const;
    int wake_fd() const { return read_fd_; }

   private:
    CommandInbox(const CommandInbox &);
    CommandInbox &operator=(const CommandInbox &);

    mutable std::mutex mutex_;
    std::deque<ConnectionCommand> queue_;
    bool closed_;
    int read_fd_;
    int write_fd_;
};

}  // namespace client
