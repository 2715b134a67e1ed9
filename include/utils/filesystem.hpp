/*
 * 설명: 저장소가 사용하는 최소한의 파일 시스템 헬퍼(재귀 디렉터리 생성, 상위 경로).
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/scrollback_store_test.cpp, tests/unit/config_store_test.cpp
 */
#pragma once

#include <string>

namespace utils {

bool MakeDirectories(const std::string &path, std::string &error);
std::string ParentPath(const std::string &path);

}  // namespace utils
