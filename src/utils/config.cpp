/*
 * 설명: INI 파일을 파싱해 클라이언트 엔진 설정을 생성하고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_parser_test.cpp
 */
#include "utils/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace {
bool StartsWith(const std::string &text, char c) { return !text.empty() && text[0] == c; }

std::string Trim(const std::string &text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string ToLower(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

struct LevelName {
    const char *name;
    config::LogLevel level;
};

const LevelName kLevelNames[] = {{"debug", config::LogLevel::kDebug},
                                 {"info", config::LogLevel::kInfo},
                                 {"warn", config::LogLevel::kWarn},
                                 {"error", config::LogLevel::kError}};

bool ParseLogLevel(const std::string &raw, config::LogLevel &out) {
    const std::string lowered = ToLower(raw);
    for (std::size_t i = 0; i < sizeof(kLevelNames) / sizeof(kLevelNames[0]); ++i) {
        if (lowered == kLevelNames[i].name) {
            out = kLevelNames[i].level;
            return true;
        }
    }
    return false;
}

// 실패하면 줄 번호를 붙이기 전의 사유를 reason에 남긴다.
bool ApplySetting(const std::string &section, const std::string &key, const std::string &value,
                  config::Settings &out, std::string &reason) {
    if (section == "client" && key == "data_dir") {
        if (value.empty()) {
            reason = "client.data_dir 누락";
            return false;
        }
        out.data_dir = value;
        return true;
    }
    if (section == "logging" && key == "level") {
        if (!ParseLogLevel(value, out.log_level)) {
            reason = "logging.level 오류";
            return false;
        }
        return true;
    }
    if (section == "logging" && key == "file") {
        out.log_file = value;
        return true;
    }
    reason = "알 수 없는 섹션/키 " + section + "." + key;
    return false;
}

std::string LineError(const std::string &what, std::size_t line_no) {
    std::ostringstream oss;
    oss << what << " (" << line_no << ")";
    return oss.str();
}
}  // namespace

namespace config {

Settings::Settings() : data_dir("data"), log_level(LogLevel::kInfo) {}

std::string Settings::ScrollbackDir() const { return data_dir + "/scrollback"; }

std::string Settings::ConnectionsPath() const { return data_dir + "/connections.json"; }

bool LoadFromFile(const std::string &path, Settings &out, std::string &error) {
    out = Settings();

    // 파일이 없으면 기본값으로 동작한다.
    std::ifstream file(path.c_str());
    if (path.empty() || !file.is_open()) {
        return true;
    }

    std::string section;
    std::string line;
    for (std::size_t line_no = 1; std::getline(file, line); ++line_no) {
        const std::string trimmed = Trim(line);
        if (trimmed.empty() || StartsWith(trimmed, '#') || StartsWith(trimmed, ';')) {
            continue;
        }

        if (StartsWith(trimmed, '[')) {
            if (trimmed.size() < 3 || trimmed.back() != ']') {
                error = LineError("잘못된 섹션 선언", line_no);
                return false;
            }
            section = ToLower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        if (section.empty()) {
            error = LineError("섹션 없음", line_no);
            return false;
        }

        const std::size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            error = LineError("키=값 형식 오류", line_no);
            return false;
        }

        std::string reason;
        if (!ApplySetting(section, ToLower(Trim(trimmed.substr(0, eq_pos))),
                          Trim(trimmed.substr(eq_pos + 1)), out, reason)) {
            error = LineError(reason, line_no);
            return false;
        }
    }
    return true;
}

std::string LogLevelToString(LogLevel level) {
    for (std::size_t i = 0; i < sizeof(kLevelNames) / sizeof(kLevelNames[0]); ++i) {
        if (kLevelNames[i].level == level) {
            return kLevelNames[i].name;
        }
    }
    return "info";
}

}  // namespace config
