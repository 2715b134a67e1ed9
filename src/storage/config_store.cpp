/*
 * 설명: 서버 프로필 파일을 로드하고, upsert 후 (server, port, nickname) 순으로 정렬해 전체를 다시 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_store_test.cpp
 */
#include "storage/config_store.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "client/serialization.hpp"
#include "utils/filesystem.hpp"

namespace {
bool SameIdentity(const client::ConnectionConfig &a, const client::ConnectionConfig &b) {
    return a.server == b.server && a.port == b.port && a.nickname == b.nickname;
}

bool IdentityLess(const client::ConnectionConfig &a, const client::ConnectionConfig &b) {
    if (a.server != b.server) {
        return a.server < b.server;
    }
    if (a.port != b.port) {
        return a.port < b.port;
    }
    return a.nickname < b.nickname;
}
}  // namespace

namespace storage {

ConfigStore::ConfigStore(const std::string &path) : path_(path) {}

bool ConfigStore::Open(std::string &error) {
    if (!utils::MakeDirectories(utils::ParentPath(path_), error)) {
        error = "failed to create config directory for " + path_ + ": " + error;
        return false;
    }

    std::vector<client::ConnectionConfig> loaded;
    std::ifstream file(path_.c_str());
    if (file.is_open()) {
        std::stringstream data;
        data << file.rdbuf();
        nlohmann::json value =
            nlohmann::json::parse(data.str(), nlohmann::json::parser_callback_t(), false);
        if (value.is_discarded() || !value.is_array()) {
            error = "failed to parse config file " + path_;
            return false;
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            client::ConnectionConfig config;
            std::string record_error;
            if (!client::ConfigFromJson(value[i], config, record_error)) {
                std::ostringstream oss;
                oss << "failed to parse config file " << path_ << " (record " << i
                    << "): " << record_error;
                error = oss.str();
                return false;
            }
            loaded.push_back(config);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connections_ = loaded;
    return true;
}

std::vector<client::ConnectionConfig> ConfigStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
}

bool ConfigStore::Upsert(const client::ConnectionConfig &config, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<client::ConnectionConfig> updated = connections_;

    bool replaced = false;
    for (std::size_t i = 0; i < updated.size(); ++i) {
        if (SameIdentity(updated[i], config)) {
            updated[i] = config;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        updated.push_back(config);
    }
    std::sort(updated.begin(), updated.end(), IdentityLess);

    if (!Persist(updated, error)) {
        return false;
    }
    connections_ = updated;
    return true;
}

bool ConfigStore::Persist(const std::vector<client::ConnectionConfig> &connections,
                          std::string &error) const {
    nlohmann::json value = nlohmann::json::array();
    for (std::size_t i = 0; i < connections.size(); ++i) {
        value.push_back(client::ConfigToJson(connections[i]));
    }

    std::ofstream file(path_.c_str(), std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        error = "failed to write config file " + path_;
        return false;
    }
    file << client::DumpJson(value, 2) << '\n';
    file.flush();
    if (!file) {
        error = "failed to write config file " + path_;
        return false;
    }
    return true;
}

}  // namespace storage
