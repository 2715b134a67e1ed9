/*
 * 설명: mkdir(2)로 경로의 각 구성 요소를 차례로 만든다. 이미 존재하는 디렉터리는 성공으로 본다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/scrollback_store_test.cpp
 */
#include "utils/filesystem.hpp"

#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <cstring>

namespace {
bool IsDirectory(const std::string &path) {
    struct stat info;
    return stat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);
}
}  // namespace

namespace utils {

bool MakeDirectories(const std::string &path, std::string &error) {
    if (path.empty()) {
        return true;
    }

    std::size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        std::string partial = path.substr(0, pos);
        if (partial.empty() || IsDirectory(partial)) {
            continue;
        }
        if (mkdir(partial.c_str(), 0755) < 0 && errno != EEXIST) {
            error = "failed to create directory " + partial + ": " + std::strerror(errno);
            return false;
        }
        if (!IsDirectory(partial)) {
            error = "not a directory: " + partial;
            return false;
        }
    }
    return true;
}

std::string ParentPath(const std::string &path) {
    std::size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return std::string();
    }
    if (slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

}  // namespace utils
