/*!
 * \file common_defs.h
 * \author Fedor Zilnitskiy
 * \brief Содержит общие определения, константы и стандартные заголовочные файлы, используемые в проекте "undeny".
 *
 * Этот файл централизует подключение часто используемых стандартных библиотек C++
 * и определяет значения по умолчанию утилиты: путь к файлу лога, имя службы DenyHosts,
 * команду управления службами, список обрабатываемых файлов DenyHosts, суффикс резервной копии
 * и режим прав доступа, который восстанавливается после перезаписи файла.
 */
#ifndef COMMON_DEFS_H
#define COMMON_DEFS_H

// Стандартные библиотеки C++
#include <string>       // Для использования std::string
#include <vector>       // Для использования std::vector
#include <array>        // Для использования std::array
#include <iostream>     // Для стандартных потоков ввода/вывода
#include <fstream>      // Для файловых потоков
#include <sstream>      // Для строковых потоков
#include <algorithm>    // Для стандартных алгоритмов
#include <stdexcept>    // Для стандартных исключений
#include <iomanip>      // Для манипуляторов потока
#include <chrono>       // Для работы со временем
#include <cctype>       // Для функций классификации символов (std::isdigit, std::toupper)
#include <cstring>      // Для strerror
#include <mutex>        // Для std::mutex, std::lock_guard (логгер)
#include <atomic>       // Для std::atomic (обработка сигналов)
#include <functional>   // Для std::function (проверка привилегий, источник строк)
#include <memory>       // Для std::unique_ptr
#include <csignal>      // Для std::signal и связанных типов
#include <filesystem>   // Для std::filesystem (C++17)
#include <cstdint>      // Для целочисленных типов фиксированного размера
#include <optional>     // Для std::optional

// Имя файла лога по умолчанию. Утилита запускается от root, поэтому лог лежит в домашней директории root.
const std::string DEFAULT_LOG_FILE = "/root/undeny.log"; /*!< Путь к файлу лога по умолчанию. */

// Файл конфигурации, который загружается до разбора аргументов командной строки (если существует)
const std::string DEFAULT_CONFIG_FILE = "/etc/undeny.conf"; /*!< Путь к файлу конфигурации по умолчанию. */

// --- Управление службой ---
const std::string DEFAULT_SERVICE_NAME = "denyhosts";       /*!< Имя службы DenyHosts. */
const std::string DEFAULT_SERVICE_CONTROL_COMMAND = "service"; /*!< Команда управления службами (`service <имя> start|stop`). */
constexpr int DEFAULT_SERVICE_TIMEOUT_SECONDS = 30;         /*!< Максимальное время ожидания завершения команды управления службой. */
constexpr int MAX_SERVICE_TIMEOUT_SECONDS = 3600;           /*!< Верхняя граница для SERVICE_TIMEOUT_SECONDS. */

// --- Обработка файлов ---
const std::string DEFAULT_BACKUP_SUFFIX = "_orig";          /*!< Суффикс резервной копии: "<путь>_orig". */

// Права доступа файлов DenyHosts (-rw-r--r--), совпадают с /etc/logrotate.d/denyhosts.
// Временный файл создается с правами 0600, поэтому после копирования права восстанавливаются.
constexpr unsigned int DEFAULT_TARGET_FILE_MODE = 0644;     /*!< Права, устанавливаемые на перезаписанный файл. */

const std::string DEFAULT_LOCK_FILE_PATH = "/run/undeny.lock"; /*!< Файл блокировки, защищающий от одновременного запуска. */

const std::string SCRATCH_FILE_PREFIX = "undeny_"; /*!< Префикс имени временного файла. */

/*!
 * \brief Возвращает список файлов DenyHosts, обрабатываемых по умолчанию.
 * Порядок важен: обработка прекращается на первом файле, который не удалось исправить.
 * \return Упорядоченный список абсолютных путей.
 */
inline std::vector<std::string> defaultTargetFiles() {
    return {
        "/etc/hosts.deny",
        "/var/lib/denyhosts/hosts",
        "/var/lib/denyhosts/hosts-restricted",
        "/var/lib/denyhosts/hosts-root",
        "/var/lib/denyhosts/hosts-valid",
        "/var/lib/denyhosts/users-hosts",
        "/var/lib/denyhosts/users-invalid"
    };
}

// --- Коды завершения процесса ---
constexpr int EXIT_CODE_OK = 0;                  /*!< Все файлы обработаны, служба перезапущена. */
constexpr int EXIT_CODE_INVALID_INPUT = 1;       /*!< Неверные аргументы или IP-адрес. */
constexpr int EXIT_CODE_PRIVILEGE = 2;           /*!< Запуск без прав root. */
constexpr int EXIT_CODE_LOG_SINK = 3;            /*!< Не удалось открыть файл лога. */
constexpr int EXIT_CODE_CONFIG = 4;              /*!< Ошибка в файле конфигурации. */
constexpr int EXIT_CODE_SERVICE_STOP = 5;        /*!< Не удалось остановить службу. */
constexpr int EXIT_CODE_FILES_INCOMPLETE = 6;    /*!< Обработка файлов прервана (ошибка, блокировка или сигнал). */
constexpr int EXIT_CODE_SERVICE_START = 7;       /*!< Не удалось снова запустить службу. */
constexpr int EXIT_CODE_INTERNAL_ERROR = 8;      /*!< Непредвиденное исключение. */

#endif // COMMON_DEFS_H
