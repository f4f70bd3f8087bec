/*!
 * \file undeny_runner.cpp
 * \author Fedor Zilnitskiy
 * \brief Реализация класса UndenyRunner.
 */
#include "undeny_runner.h"
#include "file_utils.h"
#include "logger.h"

#include <unistd.h> // Для geteuid

namespace {
const std::string kLogModule = "Runner";
} // namespace

std::string runStateToString(RunState state) {
    switch (state) {
        case RunState::ValidateInput: return "ValidateInput";
        case RunState::StopService:   return "StopService";
        case RunState::ProcessFiles:  return "ProcessFiles";
        case RunState::StartService:  return "StartService";
        case RunState::Done:          return "Done";
        case RunState::Aborted:       return "Aborted";
    }
    return "Unknown";
}

std::string runErrorToString(RunError error) {
    switch (error) {
        case RunError::None:                return "None";
        case RunError::InvalidInput:        return "InvalidInput";
        case RunError::PrivilegeError:      return "PrivilegeError";
        case RunError::ServiceControlError: return "ServiceControlError";
        case RunError::LockError:           return "LockError";
        case RunError::FileError:           return "FileError";
        case RunError::Interrupted:         return "Interrupted";
        case RunError::ServiceStartError:   return "ServiceStartError";
    }
    return "Unknown";
}

int RunReport::exitCode() const noexcept {
    if (state == RunState::Aborted) {
        switch (error) {
            case RunError::InvalidInput:        return EXIT_CODE_INVALID_INPUT;
            case RunError::PrivilegeError:      return EXIT_CODE_PRIVILEGE;
            case RunError::ServiceControlError: return EXIT_CODE_SERVICE_STOP;
            default:                            return EXIT_CODE_INVALID_INPUT;
        }
    }
    if (state != RunState::Done) {
        return EXIT_CODE_INVALID_INPUT; // выполнение не было доведено до конца
    }
    if (!service_restarted) {
        return EXIT_CODE_SERVICE_START;
    }
    if (error != RunError::None) {
        return EXIT_CODE_FILES_INCOMPLETE;
    }
    return EXIT_CODE_OK;
}

UndenyRunner::UndenyRunner(const UndenyConfig& config,
                           ServiceController& service,
                           const DenyFileSanitizer& sanitizer,
                           PrivilegeCheck privilege_check,
                           const std::atomic<bool>* stop_requested)
    : config_(config),
      service_(service),
      sanitizer_(sanitizer),
      privilege_check_(std::move(privilege_check)),
      stop_requested_(stop_requested) {
    if (!privilege_check_) {
        privilege_check_ = &UndenyRunner::hasRootPrivileges;
    }
}

bool UndenyRunner::hasRootPrivileges() {
    return geteuid() == 0;
}

bool UndenyRunner::stopRequested() const noexcept {
    return stop_requested_ != nullptr && stop_requested_->load();
}

RunReport UndenyRunner::validateInput(const std::vector<std::string>& args) const {
    RunReport report;
    report.state = RunState::ValidateInput;

    if (!privilege_check_()) {
        report.state = RunState::Aborted;
        report.error = RunError::PrivilegeError;
        report.message = "Утилиту нужно запускать с правами root (sudo).";
        Logger::error(report.message, kLogModule);
        return report;
    }

    if (args.size() != 1) {
        report.state = RunState::Aborted;
        report.error = RunError::InvalidInput;
        report.message = "Нужно указать ровно один IP-адрес (получено аргументов: " + std::to_string(args.size()) + ").";
        Logger::error(report.message, kLogModule);
        return report;
    }

    try {
        report.address = IPAddress::fromString(args.front());
    } catch (const std::invalid_argument& e) {
        report.state = RunState::Aborted;
        report.error = RunError::InvalidInput;
        report.message = "'" + args.front() + "' не является корректным IP-адресом. " + e.what();
        Logger::error(report.message, kLogModule);
        return report;
    }

    report.state = RunState::StopService;
    return report;
}

RunReport UndenyRunner::execute(RunReport report) {
    if (report.state != RunState::StopService) {
        Logger::error("execute() вызван в состоянии " + runStateToString(report.state) + ", ожидалось StopService.", kLogModule);
        return report;
    }

    const std::string address = report.address.toString();
    Logger::info("Удаление " + address + " из " + std::to_string(config_.target_files.size()) + " файлов DenyHosts.", kLogModule);

    if (!service_.setServiceState(config_.service_name, ServiceState::Stopped)) {
        report.state = RunState::Aborted;
        report.error = RunError::ServiceControlError;
        report.message = "Не удалось остановить службу " + config_.service_name + ". Файлы не изменены.";
        Logger::error(report.message, kLogModule);
        return report;
    }
    report.service_stopped = true;

    report.state = RunState::ProcessFiles;
    processFiles(report);

    report.state = RunState::StartService;
    if (service_.setServiceState(config_.service_name, ServiceState::Running)) {
        report.service_restarted = true;
    } else {
        report.error = RunError::ServiceStartError;
        report.message = "Не удалось снова запустить службу " + config_.service_name + "! Служба остановлена.";
        Logger::error(report.message, kLogModule);
    }

    report.state = RunState::Done;
    Logger::info("Завершено: обработано файлов " + std::to_string(report.processed_files.size()) + " из " +
                 std::to_string(config_.target_files.size()) + ", удалено строк: " + std::to_string(report.lines_removed) +
                 ", итог: " + runErrorToString(report.error) + ".", kLogModule);
    return report;
}

void UndenyRunner::processFiles(RunReport& report) {
    FileUtils::ExclusiveFileLock lock;
    if (!config_.lock_file_path.empty() && !lock.tryAcquire(config_.lock_file_path)) {
        report.error = RunError::LockError;
        report.message = "Не удалось захватить блокировку: " + lock.lastError() + ". Файлы не изменены.";
        Logger::error(report.message, kLogModule);
        return;
    }

    const std::string needle = report.address.toString();
    const auto& files = config_.target_files;

    for (size_t i = 0; i < files.size(); ++i) {
        if (stopRequested()) {
            report.error = RunError::Interrupted;
            report.message = "Получен сигнал завершения, пропущено файлов: " + std::to_string(files.size() - i) + ".";
            Logger::warn(report.message, kLogModule);
            return;
        }

        SanitizeResult result = sanitizer_.removeMatchingLines(files[i], needle);
        if (!result.success) {
            report.error = RunError::FileError;
            report.failed_file = files[i];
            report.failed_file_error = result.error;
            report.message = "Ошибка обработки " + files[i] + " (" + fileErrorToString(result.error) +
                             "): " + result.user_message + " Обработка оставшихся файлов прервана (пропущено: " +
                             std::to_string(files.size() - i - 1) + ").";
            Logger::error(report.message, kLogModule);
            return;
        }
        report.processed_files.push_back(files[i]);
        report.lines_removed += result.lines_removed;
    }
}

RunReport UndenyRunner::run(const std::vector<std::string>& args) {
    RunReport report = validateInput(args);
    if (report.state == RunState::Aborted) {
        return report;
    }
    return execute(std::move(report));
}
