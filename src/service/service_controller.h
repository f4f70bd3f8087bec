/*!
 * \file service_controller.h
 * \author Fedor Zilnitskiy
 * \brief Определяет интерфейс ServiceController для запуска и остановки системной службы
 * и его реализацию SystemServiceController, вызывающую внешнюю команду управления службами.
 */
#ifndef SERVICE_CONTROLLER_H
#define SERVICE_CONTROLLER_H

#include "common_defs.h"

#include <string>
#include <vector>
#include <chrono>

/*!
 * \enum ServiceState
 * \brief Желаемое состояние службы.
 */
enum class ServiceState {
    Running, /*!< Служба запущена (`start`). */
    Stopped  /*!< Служба остановлена (`stop`). */
};

/*!
 * \brief Возвращает действие команды управления службами для состояния: "start" или "stop".
 */
std::string serviceStateToAction(ServiceState state);

/*!
 * \class ServiceController
 * \brief Узкий интерфейс управления службой. Позволяет подменить реальную службу в тестах.
 */
class ServiceController {
public:
    virtual ~ServiceController() = default;

    /*!
     * \brief Переводит службу в указанное состояние.
     * \param service_name Имя службы (например, "denyhosts").
     * \param desired_state Желаемое состояние.
     * \return `true`, если внешний механизм сообщил об успехе. Повторных попыток не делается.
     */
    virtual bool setServiceState(const std::string& service_name, ServiceState desired_state) = 0;
};

/*!
 * \class SystemServiceController
 * \brief Управляет службой через внешнюю команду (`service` или `systemctl`).
 *
 * Команда запускается через fork/execvp без участия оболочки. Успех определяется только
 * кодом завершения 0. Команда запускается в собственной группе процессов. Если она не завершилась
 * за отведенное время, вся группа принудительно завершается (SIGKILL), и вызов считается неуспешным.
 */
class SystemServiceController final : public ServiceController {
public:
    /*!
     * \param control_command Команда управления службами. Если ее имя файла "systemctl",
     * используется порядок аргументов `systemctl <действие> <служба>`, иначе `<команда> <служба> <действие>`.
     * \param timeout Максимальное время ожидания завершения команды.
     */
    explicit SystemServiceController(std::string control_command = DEFAULT_SERVICE_CONTROL_COMMAND,
                                     std::chrono::milliseconds timeout = std::chrono::seconds(DEFAULT_SERVICE_TIMEOUT_SECONDS));

    bool setServiceState(const std::string& service_name, ServiceState desired_state) override;

    /*!
     * \brief Формирует argv для команды (без завершающего nullptr).
     */
    std::vector<std::string> buildCommandLine(const std::string& service_name, ServiceState desired_state) const;

    /*! \brief Проверяет, что команда является systemctl (по имени файла). */
    static bool isSystemctlCommand(const std::string& command);

private:
    std::string control_command_;
    std::chrono::milliseconds timeout_;

    /*!
     * \brief Запускает процесс и ждет его завершения не дольше `timeout_`.
     * \return Код завершения процесса; -1 при ошибке fork/waitpid, завершении по сигналу или таймауте.
     */
    int runAndWait(const std::vector<std::string>& argv) const;
};

#endif // SERVICE_CONTROLLER_H
