/*
 * 설명: INI 설정 파일을 로드해 클라이언트 엔진 설정(데이터 디렉터리, 로그 레벨/파일)을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#pragma once

#include <string>

namespace config {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

struct Settings {
    std::string data_dir;
    LogLevel log_level;
    std::string log_file;

    Settings();

    std::string ScrollbackDir() const;
    std::string ConnectionsPath() const;
};

bool LoadFromFile(const std::string &path, Settings &out, std::string &error);
std::string LogLevelToString(LogLevel level);

}  // namespace config
