/*
 * 설명: 스크롤백 파일 경로 계산, JSON 라인 추가, 최근 기록 조회를 구현한다. 해석할 수 없는 줄은 경고 후 건너뛴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/scrollback_store_test.cpp
 */
#include "storage/scrollback_store.hpp"

#include <sys/stat.h>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "client/serialization.hpp"
#include "utils/filesystem.hpp"

namespace storage {

std::string SanitizeComponent(const std::string &input) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(input[i]);
        bool keep = std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.';
        out.push_back(keep ? static_cast<char>(ch) : '_');
    }
    if (out.empty()) {
        out = "_";
    }
    return out;
}

ScrollbackStore::ScrollbackStore(const std::string &base_dir,
                                 const std::shared_ptr<Logger> &logger)
    : base_dir_(base_dir), logger_(logger) {}

bool ScrollbackStore::Open(std::string &error) {
    if (!utils::MakeDirectories(base_dir_, error)) {
        error = "failed to create scrollback directory at " + base_dir_ + ": " + error;
        return false;
    }
    return true;
}

std::string ScrollbackStore::TargetPath(const std::string &storage_key,
                                        const std::string &target) const {
    return base_dir_ + "/" + SanitizeComponent(storage_key) + "/" + SanitizeComponent(target) +
           ".jsonl";
}

bool ScrollbackStore::Append(const std::string &storage_key, const client::ChatMessage &message,
                             std::string &error) {
    const std::string path = TargetPath(storage_key, message.target);
    std::string line;
    try {
        line = client::DumpJson(client::ChatMessageToJson(message));
    } catch (const nlohmann::json::exception &ex) {
        error = "failed to encode scrollback record for " + path + ": " + ex.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!utils::MakeDirectories(utils::ParentPath(path), error)) {
        error = "failed to create parent directories for " + path + ": " + error;
        return false;
    }

    std::ofstream file(path.c_str(), std::ios::out | std::ios::app);
    if (!file.is_open()) {
        error = "failed to open scrollback file " + path + ": " + std::strerror(errno);
        return false;
    }
    file << line << '\n';
    file.flush();
    if (!file) {
        error = "failed to write scrollback " + path;
        return false;
    }
    return true;
}

bool ScrollbackStore::ReadLast(const std::string &storage_key, const std::string &target,
                               std::vector<client::ChatMessage> &out, std::string &error) const {
    const std::string path = TargetPath(storage_key, target);
    out.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    struct stat info;
    if (stat(path.c_str(), &info) != 0 && errno == ENOENT) {
        return true;
    }
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        error = "failed to read scrollback file " + path;
        return false;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        nlohmann::json value = nlohmann::json::parse(line, nlohmann::json::parser_callback_t(), false);
        client::ChatMessage message;
        std::string parse_error = "invalid json";
        if (value.is_discarded() || !client::ChatMessageFromJson(value, message, parse_error)) {
            std::ostringstream oss;
            oss << "스크롤백 줄 해석 실패 " << path << ":" << line_no << ": " << parse_error;
            logger_->Warn(oss.str());
            continue;
        }
        out.push_back(message);
    }
    return true;
}

bool ScrollbackStore::ReadLast(const std::string &storage_key, const std::string &target,
                               std::size_t limit, std::vector<client::ChatMessage> &out,
                               std::string &error) const {
    if (!ReadLast(storage_key, target, out, error)) {
        return false;
    }
    if (out.size() > limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return true;
}

}  // namespace storage
