/*!
 * \file undeny_config.h
 * \author Fedor Zilnitskiy
 * \brief Определяет класс UndenyConfig: параметры запуска утилиты undeny.
 *
 * Конфигурация собирается один раз при запуске (значения по умолчанию, затем файл конфигурации,
 * затем опции командной строки) и дальше передается в UndenyRunner как неизменяемый объект.
 */
#ifndef UNDENY_CONFIG_H
#define UNDENY_CONFIG_H

#include "common_defs.h"
#include "logger.h"
#include "deny_file_sanitizer.h" // Для SanitizerOptions

#include <string>
#include <vector>

/*!
 * \class UndenyConfig
 * \brief Параметры утилиты: журнал, служба, список файлов, резервные копии, блокировка.
 */
class UndenyConfig {
public:
    std::string log_file_path = DEFAULT_LOG_FILE;                       /*!< Файл журнала (обязателен для работы). */
    LogLevel log_level = LogLevel::INFO;                                /*!< Уровень журналирования. */

    std::string service_name = DEFAULT_SERVICE_NAME;                    /*!< Имя службы DenyHosts. */
    std::string service_control_command = DEFAULT_SERVICE_CONTROL_COMMAND; /*!< `service` или `systemctl` (или полный путь). */
    int service_timeout_seconds = DEFAULT_SERVICE_TIMEOUT_SECONDS;      /*!< Время ожидания команды управления службой. */

    std::vector<std::string> target_files = defaultTargetFiles();      /*!< Упорядоченный список обрабатываемых файлов. */
    std::string backup_suffix = DEFAULT_BACKUP_SUFFIX;                  /*!< Суффикс резервной копии. */
    unsigned int target_file_mode = DEFAULT_TARGET_FILE_MODE;           /*!< Права перезаписанных файлов. */
    std::string scratch_dir{};                                          /*!< Директория временных файлов (пусто = системная). */
    std::string lock_file_path = DEFAULT_LOCK_FILE_PATH;                /*!< Файл блокировки (пусто = без блокировки). */

    std::vector<std::string> positional_args{};                         /*!< Позиционные аргументы командной строки (ожидается один IP-адрес). */
    bool help_requested = false;                                        /*!< Была указана опция -h/--help. */
    bool config_load_failed = false;                                    /*!< Файл конфигурации не удалось загрузить. */

    /*!
     * \brief Загружает параметры из файла "КЛЮЧ = ЗНАЧЕНИЕ".
     * Ключи не чувствительны к регистру, '#' начинает комментарий. Первый ключ TARGET_FILE
     * заменяет список файлов по умолчанию, следующие добавляют файлы в конец списка.
     * \param config_filename Путь к файлу.
     * \param required Если `true`, отсутствие файла считается ошибкой.
     * \return `false` при ошибке разбора (или отсутствии обязательного файла). Отсутствующий необязательный файл не ошибка.
     */
    bool loadFromFile(const std::string& config_filename, bool required = false);

    /*!
     * \brief Разбирает аргументы командной строки.
     * Сначала загружается файл конфигурации (`-c/--config` или `default_config_path`, если существует),
     * затем применяются остальные опции. Аргументы, не являющиеся опциями, собираются в `positional_args`.
     * \return `false` при ошибке или если запрошена справка (`help_requested`).
     */
    bool parseCommandLineArgs(int argc, char* argv[], const std::string& default_config_path = DEFAULT_CONFIG_FILE);

    /*! \brief Параметры перезаписи файлов для DenyFileSanitizer. */
    SanitizerOptions sanitizerOptions() const;

    /*! \brief Выводит справку по использованию в stdout. */
    static void printHelp(const char* app_name);
};

#endif // UNDENY_CONFIG_H
