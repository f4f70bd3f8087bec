/*!
 * \file logger.h
 * \author Fedor Zilnitskiy
 * \brief Определяет статический класс Logger для журналирования действий утилиты undeny.
 *
 * Logger пишет журнал в файл в режиме добавления (одна строка на событие, с временной меткой)
 * и дублирует сообщения в консоль: ERROR/WARN в stderr, INFO/DEBUG в stdout.
 * Формат строки: "[ГГГГ-ММ-ДД ЧЧ:ММ:СС.мс] [УРОВЕНЬ] [pid] [модуль] сообщение".
 * Идентификатор процесса в строке позволяет различать записи разных запусков утилиты в одном файле.
 */
#ifndef LOGGER_H
#define LOGGER_H

#include "common_defs.h" // Включает <string>, <mutex>, <chrono>, <iomanip>, <fstream>, <sstream>, <iostream>

#include <string>
#include <fstream>
#include <mutex>

/*!
 * \enum LogLevel
 * \brief Определяет уровни важности для логируемых сообщений.
 */
enum class LogLevel {
    DEBUG = 0, /*!< Детальная отладочная информация (например, каждая удаленная строка). */
    INFO  = 1, /*!< Информационные сообщения о ходе выполнения. */
    WARN  = 2, /*!< Предупреждения о некритических проблемах. */
    ERROR = 3, /*!< Ошибки, из-за которых операция не выполнена. */
    NONE  = 4  /*!< Полное отключение логирования. */
};

/*!
 * \class Logger
 * \brief Статический класс для логирования сообщений.
 *
 * Предоставляет методы `init`, `setLevel`, `debug`, `info`, `warn`, `error`.
 * Не предназначен для создания экземпляров.
 */
class Logger {
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /*!
     * \brief Инициализирует логгер с указанным уровнем и, опционально, файлом для вывода.
     * Файл открывается в режиме добавления. Повторный вызов закрывает предыдущий файл.
     * \param initial_level Начальный уровень логирования.
     * \param log_file_path Путь к файлу лога. Если пуст, вывод только в консоль.
     * \param echo_to_console Дублировать ли сообщения в stdout/stderr.
     * \return `false`, если путь к файлу указан, но файл открыть не удалось (логирование только в консоль).
     */
    static bool init(LogLevel initial_level = LogLevel::INFO, const std::string& log_file_path = "", bool echo_to_console = true);

    /*!
     * \brief Закрывает файл лога (если открыт) и сбрасывает состояние логгера.
     */
    static void shutdown();

    static void setLevel(LogLevel level);
    static LogLevel getLevel() noexcept;

    /*!
     * \brief Проверяет, открыт ли сейчас файл лога.
     */
    static bool isFileSinkOpen();

    static void debug(const std::string& message, const std::string& module = "");
    static void info(const std::string& message, const std::string& module = "");
    static void warn(const std::string& message, const std::string& module = "");
    static void error(const std::string& message, const std::string& module = "");

    /*!
     * \brief Преобразует строку ("debug", "INFO", "Warn", ...) в LogLevel без учета регистра.
     * \param text Строка с именем уровня.
     * \param[out] level Результат разбора (не изменяется при неудаче).
     * \return `true`, если имя уровня распознано.
     */
    static bool parseLevel(const std::string& text, LogLevel& level);

    /*! \brief Имя уровня для вывода в журнал и справку. */
    static std::string levelToString(LogLevel level);

private:
    Logger() = default;

    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ofstream log_file_stream_;
    static bool use_file_;
    static bool echo_to_console_;
    static bool initialized_;

    /*!
     * \brief Внутренний метод для формирования и вывода лог-сообщения.
     * Вызывается публичными методами логирования под мьютексом.
     */
    static void log_internal(LogLevel level, const std::string& level_str, const std::string& module, const std::string& message);

    /*!
     * \brief Генерирует временную метку для лог-сообщения.
     * \return Строка с временной меткой в формате "ГГГГ-ММ-ДД ЧЧ:ММ:СС.мс".
     */
    static std::string get_timestamp();
};

#endif // LOGGER_H
