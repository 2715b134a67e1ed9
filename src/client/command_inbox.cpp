/*
 * 설명: 명령 큐와 깨움 파이프를 관리한다. 파이프가 가득 차도 이미 깨움이 대기 중이므로 무시한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/command_inbox_test.cpp
 */
#include "client/command_inbox.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace {
void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    fcntl(fd, F_SETFD, FD_CLOEXEC);
}
}  // namespace

namespace client {

CommandInbox::CommandInbox() : closed_(false), read_fd_(-1), write_fd_(-1) {
    int fds[2];
    if (pipe(fds) < 0) {
        throw std::runtime_error(std::string("명령 큐 파이프 생성 실패: ") + std::strerror(errno));
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
    SetNonBlocking(read_fd_);
    SetNonBlocking(write_fd_);
}

CommandInbox::~CommandInbox() {
    close(read_fd_);
    close(write_fd_);
}

bool CommandInbox::Send(const ConnectionCommand &command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    queue_.push_back(command);

    // 파이프가 가득 찼다면 이미 깨움이 대기 중이다.
    const char wake = 1;
    if (write(write_fd_, &wake, 1) < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        queue_.pop_back();
        return false;
    }
    return true;
}

bool CommandInbox::TryReceive(ConnectionCommand &out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    out = queue_.front();
    queue_.pop_front();
    return true;
}

void CommandInbox::DrainWakeups() {
    char buf[64];
    while (read(read_fd_, buf, sizeof(buf)) > 0) {
    }
}

void CommandInbox::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    queue_.clear();
}

bool CommandInbox::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace client
