// Предполагаемый путь: src/app/undeny_main.cpp
#include "common_defs.h"
#include "logger.h"
#include "undeny_config.h"
#include "undeny_runner.h"
#include "deny_file_sanitizer.h"
#include "service_controller.h"

#include <iostream>
#include <string>
#include <atomic>
#include <chrono>

#include <cstdio>   // Для perror
#include <signal.h> // Для sigaction
#include <unistd.h> // Для write в обработчике сигнала
#include <cstring>  // Для std::memset, strlen в обработчике сигнала

// Флаг запроса завершения. Проверяется между файлами: текущий файл дообрабатывается,
// оставшиеся пропускаются, служба запускается снова.
std::atomic<bool> g_undeny_should_stop(false);

void signalHandler(int signum) {
    const char* msg_sigint = "\n[undeny] Получен SIGINT. Оставшиеся файлы будут пропущены.\n";
    const char* msg_sigterm = "\n[undeny] Получен SIGTERM. Оставшиеся файлы будут пропущены.\n";
    const char* msg = (signum == SIGINT) ? msg_sigint : msg_sigterm;
    ssize_t written_bytes [[maybe_unused]] = write(STDERR_FILENO, msg, strlen(msg));
    g_undeny_should_stop.store(true);
}

void setup_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    if (sigaction(SIGINT, &sa, nullptr) == -1) {
        perror("[undeny] Не удалось установить обработчик SIGINT");
    }
    if (sigaction(SIGTERM, &sa, nullptr) == -1) {
        perror("[undeny] Не удалось установить обработчик SIGTERM");
    }
}


int main(int argc, char* argv[]) {
    // До открытия файла журнала сообщения идут только в консоль
    Logger::init(LogLevel::WARN);
    const std::string main_log_prefix = "[Main] ";

    UndenyConfig config;
    if (!config.parseCommandLineArgs(argc, argv)) {
        if (config.help_requested) {
            return EXIT_CODE_OK;
        }
        return config.config_load_failed ? EXIT_CODE_CONFIG : EXIT_CODE_INVALID_INPUT;
    }
    Logger::setLevel(config.log_level);

    try {
        SystemServiceController service(config.service_control_command,
                                        std::chrono::seconds(config.service_timeout_seconds));
        DenyFileSanitizer sanitizer(config.sanitizerOptions());
        UndenyRunner runner(config, service, sanitizer, &UndenyRunner::hasRootPrivileges, &g_undeny_should_stop);

        RunReport report = runner.validateInput(config.positional_args);
        if (report.state == RunState::Aborted) {
            if (report.error == RunError::InvalidInput) {
                UndenyConfig::printHelp(argv[0]);
            }
            return report.exitCode();
        }

        if (!Logger::init(config.log_level, config.log_file_path)) {
            std::cerr << "Ошибка: не удалось открыть файл журнала '" << config.log_file_path << "'.\n"
                      << "Проверьте LOG_FILE_PATH в конфигурации или опцию --log-file." << std::endl;
            return EXIT_CODE_LOG_SINK;
        }

        setup_signal_handlers();
        report = runner.execute(std::move(report));

        if (report.exitCode() != EXIT_CODE_OK) {
            std::cerr << "Ошибка: " << report.message << std::endl;
        }
        const int exit_code = report.exitCode();
        Logger::shutdown();
        return exit_code;
    } catch (const std::exception& e) {
        Logger::error(main_log_prefix + "Непредвиденное исключение: " + e.what());
        Logger::shutdown();
        return EXIT_CODE_INTERNAL_ERROR;
    }
}
