/*!
 * \file deny_file_sanitizer.h
 * \author Fedor Zilnitskiy
 * \brief Определяет класс DenyFileSanitizer, удаляющий из файла DenyHosts все строки с заданным адресом.
 *
 * Файл перезаписывается в несколько шагов: отфильтрованные строки сначала пишутся во временный файл;
 * только если чтение прошло без ошибок, исходное содержимое копируется в резервную копию
 * "<путь>_orig", содержимое временного файла копируется поверх исходного файла (копирование, а не
 * rename: временный файл может лежать на другой файловой системе), и права файла восстанавливаются.
 * При ошибке чтения исходный файл не изменяется. Временный файл удаляется на любом пути выхода.
 */
#ifndef DENY_FILE_SANITIZER_H
#define DENY_FILE_SANITIZER_H

#include "common_defs.h" // Для std::string, std::function, std::unique_ptr, std::filesystem

#include <string>
#include <istream>
#include <ostream>
#include <functional>
#include <memory>
#include <filesystem>

/*!
 * \enum FileError
 * \brief Причина, по которой файл не удалось обработать.
 */
enum class FileError {
    None,              /*!< Ошибки нет. */
    OpenFailed,        /*!< Файл не существует, не является обычным файлом или не открывается на чтение. Файл не изменен. */
    ScratchFailed,     /*!< Не удалось создать временный файл. Файл не изменен. */
    ReadFailed,        /*!< Ошибка ввода-вывода при чтении. Файл не изменен. */
    WriteFailed,       /*!< Ошибка записи во временный файл. Файл не изменен. */
    BackupFailed,      /*!< Не удалось записать резервную копию. Файл не изменен. */
    ReplaceFailed,     /*!< Не удалось скопировать результат поверх файла. Резервная копия уже записана. */
    PermissionsFailed  /*!< Содержимое заменено, но права доступа восстановить не удалось. */
};

/*!
 * \brief Возвращает имя ошибки для журнала ("OpenFailed", ...).
 */
std::string fileErrorToString(FileError error);

/*!
 * \struct SanitizeResult
 * \brief Результат обработки одного файла.
 */
struct SanitizeResult {
    bool success = false;             /*!< `true`, если файл перезаписан (или не содержал адреса и перезаписан без изменений). */
    FileError error = FileError::None;/*!< Причина неудачи, `FileError::None` при успехе. */
    size_t lines_read = 0;            /*!< Количество прочитанных строк. */
    size_t lines_removed = 0;         /*!< Количество удаленных строк. */
    std::string user_message{};       /*!< Краткое сообщение для оператора. */
    std::string error_details{};      /*!< Подробности ошибки (errno, исключение) для журнала. */
};

/*!
 * \struct SanitizerOptions
 * \brief Параметры перезаписи файлов.
 */
struct SanitizerOptions {
    std::string backup_suffix = DEFAULT_BACKUP_SUFFIX;  /*!< Суффикс резервной копии. */
    unsigned int target_mode = DEFAULT_TARGET_FILE_MODE;/*!< Права, устанавливаемые на перезаписанный файл. */
    std::string scratch_dir{};                          /*!< Директория для временных файлов (пусто = системная). */
};

/*!
 * \struct FilterStats
 * \brief Итог потоковой фильтрации строк.
 */
struct FilterStats {
    size_t lines_read = 0;
    size_t lines_removed = 0;
    bool read_failed = false;   /*!< Входной поток перешел в состояние bad. */
    bool write_failed = false;  /*!< Выходной поток перешел в состояние fail. */
};

/*!
 * \class DenyFileSanitizer
 * \brief Удаляет из текстового файла все строки, содержащие заданную подстроку.
 *
 * Совпадение проверяется как вхождение подстроки, без учета границ слов: адрес "1.2.3.4"
 * удаляет и строку с "11.2.3.45". Строки без совпадения копируются байт в байт,
 * включая окончания строк ("\n", "\r\n", отсутствие перевода строки в конце файла).
 */
class DenyFileSanitizer final {
public:
    /*!
     * \brief Функция, открывающая исходный файл на чтение.
     * Возвращает nullptr или поток в состоянии fail, если файл открыть не удалось.
     */
    using SourceOpener = std::function<std::unique_ptr<std::istream>(const std::filesystem::path&)>;

    explicit DenyFileSanitizer(SanitizerOptions options = SanitizerOptions());

    /*!
     * \brief Конструктор с собственным способом открытия исходного файла (используется в тестах для имитации ошибок чтения).
     */
    DenyFileSanitizer(SanitizerOptions options, SourceOpener opener);

    /*!
     * \brief Удаляет из файла `path` все строки, содержащие `needle`.
     * \param path Путь к файлу.
     * \param needle Искомая подстрока (адрес). Пустая строка не совпадает ни с чем.
     * \return Результат; при `success == false` поле `error` указывает причину.
     */
    SanitizeResult removeMatchingLines(const std::string& path, const std::string& needle) const;

    /*!
     * \brief Копирует строки из `in` в `out`, пропуская строки с `needle`.
     * \param log_context Имя файла для отладочных сообщений о удаленных строках.
     */
    static FilterStats filterLines(std::istream& in, std::ostream& out, const std::string& needle,
                                   const std::string& log_context = "");

    /*! \brief Проверяет вхождение `needle` в строку. */
    static bool lineMatches(const std::string& line, const std::string& needle) noexcept;

    /*! \brief Путь резервной копии для файла: `path` + суффикс. */
    std::string backupPathFor(const std::string& path) const;

    const SanitizerOptions& options() const noexcept { return options_; }

private:
    SanitizerOptions options_;
    SourceOpener opener_;

    static std::unique_ptr<std::istream> openFileForReading(const std::filesystem::path& path);
};

#endif // DENY_FILE_SANITIZER_H
