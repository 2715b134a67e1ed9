/*
 * 설명: irc-engine 실행 진입점. 설정 파일을 반영해 로거와 저장소, 엔진을 만들고 표준 입력 명령을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/shell_test.cpp
 */
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "cli/shell.hpp"
#include "client/engine.hpp"
#include "client/event_sink.hpp"
#include "storage/config_store.hpp"
#include "storage/scrollback_store.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

int main(int argc, char *argv[]) {
    if (argc > 2) {
        std::cerr << "사용법: ./irc-engine [config_path]\n";
        return 1;
    }

    std::string config_path = argc == 2 ? argv[1] : "config/client.ini";

    config::Settings settings;
    std::string error;
    if (!config::LoadFromFile(config_path, settings, error)) {
        std::cerr << "설정 파일 오류: " << error << "\n";
        return 1;
    }

    // 끊긴 소켓에 쓰더라도 프로세스가 종료되지 않게 한다.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        std::shared_ptr<Logger> logger(new Logger());
        logger->SetLevel(settings.log_level);
        if (!logger->SetOutput(settings.log_file)) {
            std::cerr << "로그 파일 열기 실패: " << settings.log_file << "\n";
            return 1;
        }

        std::shared_ptr<storage::ScrollbackStore> scrollback(
            new storage::ScrollbackStore(settings.ScrollbackDir(), logger));
        if (!scrollback->Open(error)) {
            std::cerr << "저장소 오류: " << error << "\n";
            return 1;
        }
        std::shared_ptr<storage::ConfigStore> config_store(
            new storage::ConfigStore(settings.ConnectionsPath()));
        if (!config_store->Open(error)) {
            std::cerr << "저장소 오류: " << error << "\n";
            return 1;
        }

        std::shared_ptr<client::EventSink> sink(new client::JsonLineEventSink(std::cout));
        client::Engine engine(sink, scrollback, config_store, logger);
        logger->Info("irc-engine 시작 (data_dir=" + settings.data_dir + ")");

        std::string line;
        while (std::getline(std::cin, line)) {
            if (cli::ExecuteLine(engine, line, std::cout) == cli::ShellResult::kExit) {
                break;
            }
        }
        engine.Shutdown();
    } catch (const std::exception &ex) {
        std::cerr << "엔진 오류: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
