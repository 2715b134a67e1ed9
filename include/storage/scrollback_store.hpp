/*
 * 설명: (저장 키, 대상)마다 JSON 라인 파일 하나에 채팅 기록을 덧붙이고 최근 N개를 읽어 온다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/scrollback_store_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client/types.hpp"
#include "utils/logger.hpp"

namespace storage {

class ScrollbackStore {
   public:
    ScrollbackStore(const std::string &base_dir, const std::shared_ptr<Logger> &logger);

    bool Open(std::string &error);
    bool Append(const std::string &storage_key, const client::ChatMessage &message,
                std::string &error);
    bool ReadLast(const std::string &storage_key, const std::string &target,
                  std::vector<client::ChatMessage> &out, std::string &error) const;
    bool ReadLast(const std::string &storage_key, const std::string &target, std::size_t limit,
                  std::vector<client::ChatMessage> &out, std::string &error) const;

    std::string TargetPath(const std::string &storage_key, const std::string &target) const;

   private:
    std::string base_dir_;
    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
};

// [A-Za-z0-9-_.] 외의 바이트는 '_'로 바꾸고, 빈 문자열은 "_"가 된다.
std::string SanitizeComponent(const std::string &input);

}  // namespace storage
