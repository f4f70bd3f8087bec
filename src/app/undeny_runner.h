/*!
 * \file undeny_runner.h
 * \author Fedor Zilnitskiy
 * \brief Определяет класс UndenyRunner: последовательность шагов утилиты undeny.
 *
 * Шаги: ValidateInput -> StopService -> ProcessFiles -> StartService -> Done.
 * Из ValidateInput и StopService возможен переход в Aborted (ни служба, ни файлы не затронуты).
 * Обработка файлов не транзакционна: файлы до первой ошибки уже изменены, файлы после нее не трогаются.
 * Служба запускается снова всегда, когда была остановлена, независимо от результата обработки файлов.
 */
#ifndef UNDENY_RUNNER_H
#define UNDENY_RUNNER_H

#include "common_defs.h"
#include "undeny_config.h"
#include "ip_address.h"
#include "deny_file_sanitizer.h"
#include "service_controller.h"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

/*!
 * \enum RunState
 * \brief Состояние (шаг) выполнения.
 */
enum class RunState {
    ValidateInput,
    StopService,
    ProcessFiles,
    StartService,
    Done,
    Aborted
};

/*!
 * \enum RunError
 * \brief Основная ошибка запуска.
 */
enum class RunError {
    None,
    InvalidInput,        /*!< Неверное число аргументов или некорректный IPv4-адрес. */
    PrivilegeError,      /*!< Запуск без прав root. */
    ServiceControlError, /*!< Не удалось остановить службу. */
    LockError,           /*!< Файл блокировки занят другим запуском или недоступен. */
    FileError,           /*!< Один из файлов не удалось обработать, остальные пропущены. */
    Interrupted,         /*!< Получен сигнал завершения, оставшиеся файлы пропущены. */
    ServiceStartError    /*!< Не удалось снова запустить службу. */
};

std::string runStateToString(RunState state);
std::string runErrorToString(RunError error);

/*!
 * \struct RunReport
 * \brief Итог выполнения.
 */
struct RunReport {
    RunState state = RunState::ValidateInput;   /*!< Текущее (после завершения: конечное) состояние. */
    RunError error = RunError::None;            /*!< Основная ошибка. */
    std::string message{};                      /*!< Сообщение об ошибке для оператора. */
    IPAddress address{};                        /*!< Проверенный адрес (после ValidateInput). */
    std::vector<std::string> processed_files{}; /*!< Успешно обработанные файлы, по порядку. */
    std::string failed_file{};                  /*!< Файл, на котором обработка остановилась. */
    FileError failed_file_error = FileError::None;
    size_t lines_removed = 0;                   /*!< Сколько строк удалено во всех файлах. */
    bool service_stopped = false;
    bool service_restarted = false;

    /*! \brief Код завершения процесса (см. EXIT_CODE_* в common_defs.h). */
    int exitCode() const noexcept;
};

/*!
 * \class UndenyRunner
 * \brief Выполняет удаление адреса из всех файлов DenyHosts с остановкой и запуском службы.
 */
class UndenyRunner final {
public:
    /*! \brief Проверка прав, по умолчанию `geteuid() == 0`. */
    using PrivilegeCheck = std::function<bool()>;

    /*!
     * \param config Неизменяемая конфигурация запуска.
     * \param service Управление службой DenyHosts.
     * \param sanitizer Обработка отдельных файлов.
     * \param privilege_check Проверка прав суперпользователя.
     * \param stop_requested Флаг запроса завершения (сигнал). Проверяется между файлами; может быть nullptr.
     */
    UndenyRunner(const UndenyConfig& config,
                 ServiceController& service,
                 const DenyFileSanitizer& sanitizer,
                 PrivilegeCheck privilege_check = &UndenyRunner::hasRootPrivileges,
                 const std::atomic<bool>* stop_requested = nullptr);

    /*!
     * \brief Шаг ValidateInput: права, ровно один аргумент, корректный IPv4-адрес.
     * \return Отчет в состоянии StopService (можно продолжать) или Aborted.
     */
    RunReport validateInput(const std::vector<std::string>& args) const;

    /*!
     * \brief Шаги StopService -> ProcessFiles -> StartService -> Done для проверенного отчета.
     * \param report Результат `validateInput` в состоянии StopService. Иной отчет возвращается без изменений.
     */
    RunReport execute(RunReport report);

    /*! \brief `validateInput`, затем `execute`. */
    RunReport run(const std::vector<std::string>& args);

    static bool hasRootPrivileges();

private:
    const UndenyConfig& config_;
    ServiceController& service_;
    const DenyFileSanitizer& sanitizer_;
    PrivilegeCheck privilege_check_;
    const std::atomic<bool>* stop_requested_;

    void processFiles(RunReport& report);
    bool stopRequested() const noexcept;
};

#endif // UNDENY_RUNNER_H
