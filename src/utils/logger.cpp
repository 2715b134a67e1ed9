/*
 * 설명: 로그 레벨 필터링과 파일/표준 오류 출력 제어를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/logger_test.cpp
 */
#include "utils/logger.hpp"

#include <iostream>
#include <sstream>

Logger::Logger() : level_(config::LogLevel::kInfo) {}

void Logger::SetLevel(config::LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

bool Logger::SetOutput(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = path;
    if (file_.is_open()) {
        file_.close();
    }

    if (!path.empty() && path != "-") {
        file_.open(path.c_str(), std::ios::out | std::ios::app);
        return file_.is_open();
    }
    return true;
}

void Logger::Log(config::LogLevel level, const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!IsEnabled(level)) {
        return;
    }
    std::ostringstream oss;
    oss << "[" << config::LogLevelToString(level) << "] " << message;
    WriteLine(oss.str());
}

bool Logger::IsEnabled(config::LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::WriteLine(const std::string &line) {
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
        return;
    }
    std::cerr << line << '\n';
}
