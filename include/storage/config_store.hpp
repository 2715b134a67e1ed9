/*
 * 설명: 저장된 서버 프로필을 (server, port, nickname) 기준으로 upsert하고 정렬된 JSON 배열 파일로 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_store_test.cpp
 */
#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "client/types.hpp"

namespace storage {

class ConfigStore {
   public:
    explicit ConfigStore(const std::string &path);

    bool Open(std::string &error);
    std::vector<client::ConnectionConfig> List() const;
    bool Upsert(const client::ConnectionConfig &config, std::string &error);

   private:
    bool Persist(const std::vector<client::ConnectionConfig> &connections, std::string &error) const;

    std::string path_;
    mutable std::mutex mutex_;
    std::vector<client::ConnectionConfig> connections_;
};

}  // namespace storage
