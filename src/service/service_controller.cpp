/*!
 * \file service_controller.cpp
 * \author Fedor Zilnitskiy
 * \brief Реализация SystemServiceController.
 */
#include "service_controller.h"
#include "logger.h"

#include <cerrno>
#include <cstring>
#include <thread>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
const std::string kLogModule = "Service";
constexpr std::chrono::milliseconds kPollInterval(50);
constexpr int kExecFailedExitCode = 127;
} // namespace

std::string serviceStateToAction(ServiceState state) {
    return state == ServiceState::Running ? "start" : "stop";
}

SystemServiceController::SystemServiceController(std::string control_command, std::chrono::milliseconds timeout)
    : control_command_(std::move(control_command)), timeout_(timeout) {
}

bool SystemServiceController::isSystemctlCommand(const std::string& command) {
    return std::filesystem::path(command).filename() == "systemctl";
}

std::vector<std::string> SystemServiceController::buildCommandLine(const std::string& service_name, ServiceState desired_state) const {
    const std::string action = serviceStateToAction(desired_state);
    if (isSystemctlCommand(control_command_)) {
        return {control_command_, action, service_name};
    }
    return {control_command_, service_name, action};
}

bool SystemServiceController::setServiceState(const std::string& service_name, ServiceState desired_state) {
    const std::string action = serviceStateToAction(desired_state);
    if (service_name.empty()) {
        Logger::error("Имя службы не задано, команда '" + action + "' не выполнена.", kLogModule);
        return false;
    }
    if (control_command_.empty()) {
        Logger::error("Команда управления службами не задана, '" + action + " " + service_name + "' не выполнено.", kLogModule);
        return false;
    }

    std::vector<std::string> argv = buildCommandLine(service_name, desired_state);
    std::string command_line;
    for (const auto& arg : argv) {
        if (!command_line.empty()) command_line += " ";
        command_line += arg;
    }
    Logger::debug("Выполняется: " + command_line, kLogModule);

    int exit_code = runAndWait(argv);
    if (exit_code == 0) {
        Logger::info(action + " " + service_name + ": OK", kLogModule);
        return true;
    }
    if (exit_code == kExecFailedExitCode) {
        Logger::error(action + " " + service_name + ": не удалось запустить '" + control_command_ + "' (код 127).", kLogModule);
    } else if (exit_code > 0) {
        Logger::error(action + " " + service_name + ": команда завершилась с кодом " + std::to_string(exit_code) + ".", kLogModule);
    } else {
        Logger::error(action + " " + service_name + ": команда не выполнена.", kLogModule);
    }
    return false;
}

int SystemServiceController::runAndWait(const std::vector<std::string>& argv) const {
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        Logger::error("fork() завершился ошибкой: " + std::string(std::strerror(errno)), kLogModule);
        return -1;
    }
    if (pid == 0) {
        // Дочерний процесс: только async-signal-safe вызовы до exec.
        // Своя группа процессов, чтобы при таймауте завершить и потомков команды (systemctl).
        setpgid(0, 0);
        execvp(c_argv[0], c_argv.data());
        _exit(kExecFailedExitCode);
    }
    // Повтор в родителе закрывает гонку с kill(-pid); EACCES означает, что потомок уже выполнил exec
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        Logger::debug("setpgid(" + std::to_string(pid) + ") завершился ошибкой: " + std::string(std::strerror(errno)), kLogModule);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    int status = 0;
    while (true) {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error("waitpid() завершился ошибкой: " + std::string(std::strerror(errno)), kLogModule);
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::error("Команда '" + argv[0] + "' не завершилась за " +
                          std::to_string(timeout_.count()) + " мс, группа процессов " + std::to_string(pid) + " завершается принудительно.",
                          kLogModule);
            if (kill(-pid, SIGKILL) != 0) {
                kill(pid, SIGKILL);
            }
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            return -1;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        Logger::error("Команда '" + argv[0] + "' завершена сигналом " + std::to_string(WTERMSIG(status)) + ".", kLogModule);
    }
    return -1;
}
