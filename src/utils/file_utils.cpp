/*!
 * \file file_utils.cpp
 * \author Fedor Zilnitskiy
 * \brief Реализация утилит для работы с файловой системой.
 */
#include "file_utils.h"
#include "logger.h" // Для логирования ошибок освобождения ресурсов

#include <cerrno>
#include <cstring>    // Для strerror
#include <vector>

#include <fcntl.h>    // Для open
#include <sys/file.h> // Для flock
#include <sys/stat.h> // Для режимов доступа
#include <unistd.h>   // Для close

// Проверка на доступность <filesystem> во время компиляции
#ifndef __cpp_lib_filesystem
    #error "C++17 std::filesystem is required for file_utils.cpp. Check your compiler and C++ standard settings."
#endif

namespace FileUtils {

    ScratchFile::ScratchFile(const std::filesystem::path& directory, const std::string& prefix) {
        std::filesystem::path dir = directory.empty() ? std::filesystem::temp_directory_path() : directory;
        std::string templ = (dir / (prefix + "XXXXXX")).string();

        // mkstemp изменяет шаблон на месте, поэтому нужен изменяемый буфер
        std::vector<char> buffer(templ.begin(), templ.end());
        buffer.push_back('\0');

        int fd = mkstemp(buffer.data());
        if (fd < 0) {
            int saved_errno = errno;
            throw std::runtime_error("Не удалось создать временный файл в '" + dir.string() + "': " + std::strerror(saved_errno));
        }
        path_ = std::filesystem::path(buffer.data());
        if (close(fd) != 0) {
            int saved_errno = errno;
            remove();
            throw std::runtime_error("Не удалось закрыть временный файл '" + std::string(buffer.data()) + "': " + std::strerror(saved_errno));
        }
    }

    ScratchFile::~ScratchFile() {
        if (!remove()) {
            Logger::warn("Временный файл '" + path_.string() + "' не удалось удалить.", "FileUtils");
        }
    }

    bool ScratchFile::remove() noexcept {
        if (path_.empty()) {
            return true;
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            return false;
        }
        path_.clear();
        return true;
    }

    ExclusiveFileLock::~ExclusiveFileLock() {
        release();
    }

    bool ExclusiveFileLock::tryAcquire(const std::filesystem::path& lock_path) {
        release();
        last_error_.clear();

        int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (fd < 0) {
            last_error_ = "не удалось открыть файл блокировки '" + lock_path.string() + "': " + std::strerror(errno);
            return false;
        }
        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int saved_errno = errno;
            if (saved_errno == EWOULDBLOCK) {
                last_error_ = "файл блокировки '" + lock_path.string() + "' удерживается другим процессом";
            } else {
                last_error_ = "flock('" + lock_path.string() + "') завершился ошибкой: " + std::strerror(saved_errno);
            }
            close(fd);
            return false;
        }
        fd_ = fd;
        return true;
    }

    void ExclusiveFileLock::release() noexcept {
        if (fd_ < 0) {
            return;
        }
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }

    std::filesystem::path resolveScratchDirectory(const std::string& configured) {
        if (!configured.empty()) {
            return std::filesystem::path(configured);
        }
        return std::filesystem::temp_directory_path();
    }

    bool isRegularFile(const std::filesystem::path& path) noexcept {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }

    std::optional<unsigned int> permissionBits(const std::filesystem::path& path) noexcept {
        std::error_code ec;
        std::filesystem::file_status st = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(st)) {
            return std::nullopt;
        }
        return static_cast<unsigned int>(st.permissions() & std::filesystem::perms::mask) & 07777u;
    }

    std::string formatMode(unsigned int mode) {
        std::ostringstream oss;
        oss << "0" << std::oct << (mode & 07777u);
        return oss.str();
    }

} // namespace FileUtils
