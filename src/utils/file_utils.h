/*!
 * \file file_utils.h
 * \author Fedor Zilnitskiy
 * \brief Объявляет утилиты для работы с файловой системой: временный файл с гарантированным удалением,
 * эксклюзивную файловую блокировку и вспомогательные функции для прав доступа.
 *
 * Все классы здесь владеют ресурсом ОС (файл, дескриптор) и освобождают его в деструкторе,
 * поэтому ресурс освобождается на любом пути выхода из функции, включая исключения.
 * Используется C++17 `<filesystem>` и POSIX (`mkstemp`, `flock`).
 */
#ifndef FILE_UTILS_H
#define FILE_UTILS_H

#include "common_defs.h" // Включает <filesystem>, <string>, <stdexcept>
#include <string>
#include <filesystem> // C++17
#include <stdexcept>  // Для std::runtime_error

/*!
 * \brief Пространство имен для утилит работы с файлами.
 */
namespace FileUtils {

    /*!
     * \class ScratchFile
     * \brief Временный файл, который удаляется при разрушении объекта.
     *
     * Создается через `mkstemp` с правами 0600 (только владелец). Дескриптор закрывается сразу
     * после создания: содержимое записывается обычным std::ofstream по `path()`.
     */
    class ScratchFile final {
    public:
        /*!
         * \brief Создает пустой временный файл в указанной директории.
         * \param directory Директория для временного файла. Если пуста, используется системная временная директория.
         * \param prefix Префикс имени файла.
         * \throw std::runtime_error если файл создать не удалось.
         */
        explicit ScratchFile(const std::filesystem::path& directory, const std::string& prefix = SCRATCH_FILE_PREFIX);

        ~ScratchFile();

        ScratchFile(const ScratchFile&) = delete;
        ScratchFile& operator=(const ScratchFile&) = delete;

        /*! \brief Путь к временному файлу. Пуст после `remove()`. */
        const std::filesystem::path& path() const noexcept { return path_; }

        /*!
         * \brief Удаляет файл досрочно. Повторные вызовы ничего не делают.
         * \return `true`, если файла больше нет на диске.
         */
        bool remove() noexcept;

    private:
        std::filesystem::path path_;
    };

    /*!
     * \class ExclusiveFileLock
     * \brief Эксклюзивная неблокирующая блокировка `flock` на файле блокировки.
     *
     * Блокировка снимается при разрушении объекта или при завершении процесса.
     * Сам файл блокировки не удаляется: удаление открыло бы окно, в котором два процесса
     * блокируют разные inode с одним и тем же именем.
     */
    class ExclusiveFileLock final {
    public:
        ExclusiveFileLock() noexcept = default;
        ~ExclusiveFileLock();

        ExclusiveFileLock(const ExclusiveFileLock&) = delete;
        ExclusiveFileLock& operator=(const ExclusiveFileLock&) = delete;

        /*!
         * \brief Пытается захватить блокировку без ожидания.
         * \param lock_path Путь к файлу блокировки (создается при необходимости, права 0600).
         * \return `true`, если блокировка захвачена. При неудаче причина доступна через `lastError()`.
         */
        bool tryAcquire(const std::filesystem::path& lock_path);

        /*! \brief Снимает блокировку и закрывает дескриптор. */
        void release() noexcept;

        bool isLocked() const noexcept { return fd_ >= 0; }
        const std::string& lastError() const noexcept { return last_error_; }

    private:
        int fd_ = -1;
        std::string last_error_;
    };

    /*!
     * \brief Возвращает директорию для временных файлов: `configured`, если задана, иначе системную.
     * \throw std::filesystem::filesystem_error если системная временная директория недоступна.
     */
    std::filesystem::path resolveScratchDirectory(const std::string& configured);

    /*!
     * \brief Проверяет, что путь существует и является обычным файлом (симлинки разыменовываются).
     */
    bool isRegularFile(const std::filesystem::path& path) noexcept;

    /*!
     * \brief Возвращает биты прав доступа файла (например, 0644).
     * \return Права или `std::nullopt`, если файл недоступен.
     */
    std::optional<unsigned int> permissionBits(const std::filesystem::path& path) noexcept;

    /*!
     * \brief Форматирует права доступа в восьмеричном виде с ведущим нулем ("0644").
     */
    std::string formatMode(unsigned int mode);

} // namespace FileUtils

#endif // FILE_UTILS_H
