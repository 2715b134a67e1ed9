/*
 * 설명: 로그 레벨과 출력 경로를 제어하는 로거. 여러 세션 스레드가 동시에 기록해도 줄이 섞이지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/logger_test.cpp
 */
#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "utils/config.hpp"

class Logger {
   public:
    Logger();

    void SetLevel(config::LogLevel level);
    bool SetOutput(const std::string &path);
    void Log(config::LogLevel level, const std::string &message);

    void Debug(const std::string &message) { Log(config::LogLevel::kDebug, message); }
    void Info(const std::string &message) { Log(config::LogLevel::kInfo, message); }
    void Warn(const std::string &message) { Log(config::LogLevel::kWarn, message); }
    void Error(const std::string &message) { Log(config::LogLevel::kError, message); }

   private:
    std::mutex mutex_;
    config::LogLevel level_;
    std::string path_;
    std::ofstream file_;

    bool IsEnabled(config::LogLevel level) const;
    void WriteLine(const std::string &line);
};
