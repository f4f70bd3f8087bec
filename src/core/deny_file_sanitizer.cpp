/*!
 * \file deny_file_sanitizer.cpp
 * \author Fedor Zilnitskiy
 * \brief Реализация класса DenyFileSanitizer.
 */
#include "deny_file_sanitizer.h"
#include "file_utils.h"
#include "logger.h"

#include <cerrno>
#include <fstream>

namespace {
const std::string kLogModule = "Sanitizer";

SanitizeResult makeFailure(FileError error, const std::string& user_message, const std::string& details) {
    SanitizeResult result;
    result.success = false;
    result.error = error;
    result.user_message = user_message;
    result.error_details = details;
    return result;
}
} // namespace

std::string fileErrorToString(FileError error) {
    switch (error) {
        case FileError::None:              return "None";
        case FileError::OpenFailed:        return "OpenFailed";
        case FileError::ScratchFailed:     return "ScratchFailed";
        case FileError::ReadFailed:        return "ReadFailed";
        case FileError::WriteFailed:       return "WriteFailed";
        case FileError::BackupFailed:      return "BackupFailed";
        case FileError::ReplaceFailed:     return "ReplaceFailed";
        case FileError::PermissionsFailed: return "PermissionsFailed";
    }
    return "Unknown";
}

DenyFileSanitizer::DenyFileSanitizer(SanitizerOptions options)
    : options_(std::move(options)), opener_(&DenyFileSanitizer::openFileForReading) {
}

DenyFileSanitizer::DenyFileSanitizer(SanitizerOptions options, SourceOpener opener)
    : options_(std::move(options)), opener_(std::move(opener)) {
    if (!opener_) {
        opener_ = &DenyFileSanitizer::openFileForReading;
    }
}

std::unique_ptr<std::istream> DenyFileSanitizer::openFileForReading(const std::filesystem::path& path) {
    return std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
}

std::string DenyFileSanitizer::backupPathFor(const std::string& path) const {
    return path + options_.backup_suffix;
}

bool DenyFileSanitizer::lineMatches(const std::string& line, const std::string& needle) noexcept {
    if (needle.empty()) {
        return false;
    }
    return line.find(needle) != std::string::npos;
}

FilterStats DenyFileSanitizer::filterLines(std::istream& in, std::ostream& out, const std::string& needle,
                                           const std::string& log_context) {
    FilterStats stats;
    std::string line;

    while (std::getline(in, line)) {
        // eofbit после успешного getline означает, что у последней строки не было '\n'
        const bool had_newline = !in.eof();
        stats.lines_read++;

        if (lineMatches(line, needle)) {
            stats.lines_removed++;
            Logger::debug(log_context + ": удалена строка " + std::to_string(stats.lines_read) + ": " + line, kLogModule);
            continue;
        }

        out << line;
        if (had_newline) {
            out << '\n';
        }
        if (!out) {
            stats.write_failed = true;
            break;
        }
    }

    if (in.bad()) {
        stats.read_failed = true;
    }
    return stats;
}

SanitizeResult DenyFileSanitizer::removeMatchingLines(const std::string& path, const std::string& needle) const {
    const std::filesystem::path target(path);

    if (!FileUtils::isRegularFile(target)) {
        SanitizeResult res = makeFailure(FileError::OpenFailed,
            "Файл \"" + path + "\" не найден или не является обычным файлом.",
            "is_regular_file('" + path + "') == false");
        Logger::error(res.user_message, kLogModule);
        return res;
    }

    errno = 0;
    std::unique_ptr<std::istream> in = opener_(target);
    const int open_errno = errno; // подставной источник может не выставлять errno
    if (!in || !*in) {
        SanitizeResult res = makeFailure(FileError::OpenFailed,
            "Не удалось открыть файл \"" + path + "\" на чтение.",
            "open('" + path + "'): " + (open_errno != 0 ? std::string(std::strerror(open_errno)) : std::string("источник не открыт")));
        Logger::error(res.user_message + " " + res.error_details, kLogModule);
        return res;
    }

    std::unique_ptr<FileUtils::ScratchFile> scratch;
    try {
        scratch = std::make_unique<FileUtils::ScratchFile>(FileUtils::resolveScratchDirectory(options_.scratch_dir));
    } catch (const std::exception& e) {
        SanitizeResult res = makeFailure(FileError::ScratchFailed,
            "Не удалось создать временный файл для \"" + path + "\".", e.what());
        Logger::error(res.user_message + " " + res.error_details, kLogModule);
        return res;
    }
    Logger::debug(path + ": временный файл " + scratch->path().string(), kLogModule);

    FilterStats stats;
    {
        std::ofstream out(scratch->path(), std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            SanitizeResult res = makeFailure(FileError::WriteFailed,
                "Не удалось открыть временный файл для \"" + path + "\".",
                "open('" + scratch->path().string() + "'): " + std::strerror(errno));
            Logger::error(res.user_message + " " + res.error_details, kLogModule);
            return res;
        }

        stats = filterLines(*in, out, needle, path);

        if (stats.read_failed) {
            SanitizeResult res = makeFailure(FileError::ReadFailed,
                "Ошибка чтения файла \"" + path + "\". Файл оставлен без изменений.",
                "ошибка ввода-вывода после строки " + std::to_string(stats.lines_read));
            Logger::error(res.user_message + " " + res.error_details, kLogModule);
            return res;
        }

        out.close();
        if (stats.write_failed || out.fail()) {
            SanitizeResult res = makeFailure(FileError::WriteFailed,
                "Ошибка записи временного файла для \"" + path + "\". Файл оставлен без изменений.",
                "запись в '" + scratch->path().string() + "' не удалась");
            Logger::error(res.user_message + " " + res.error_details, kLogModule);
            return res;
        }
    }
    in.reset(); // исходный файл закрывается до копирования

    const std::string backup_path = backupPathFor(path);
    std::error_code ec;

    std::filesystem::copy_file(target, backup_path, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        SanitizeResult res = makeFailure(FileError::BackupFailed,
            "Не удалось создать резервную копию \"" + backup_path + "\". Файл оставлен без изменений.",
            ec.message());
        Logger::error(res.user_message + " " + res.error_details, kLogModule);
        return res;
    }

    std::filesystem::copy_file(scratch->path(), target, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        SanitizeResult res = makeFailure(FileError::ReplaceFailed,
            "Не удалось записать результат в \"" + path + "\". Исходное содержимое сохранено в \"" + backup_path + "\".",
            ec.message());
        Logger::error(res.user_message + " " + res.error_details, kLogModule);
        return res;
    }

    // copy_file переносит права временного файла (0600), восстанавливаем права файлов DenyHosts
    std::filesystem::permissions(target, static_cast<std::filesystem::perms>(options_.target_mode),
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        SanitizeResult res = makeFailure(FileError::PermissionsFailed,
            "Не удалось установить права " + FileUtils::formatMode(options_.target_mode) + " на \"" + path + "\".",
            ec.message());
        res.lines_read = stats.lines_read;
        res.lines_removed = stats.lines_removed;
        Logger::error(res.user_message + " " + res.error_details, kLogModule);
        return res;
    }

    if (!scratch->remove()) {
        Logger::warn("Не удалось удалить временный файл " + scratch->path().string(), kLogModule);
    }

    SanitizeResult result;
    result.success = true;
    result.lines_read = stats.lines_read;
    result.lines_removed = stats.lines_removed;
    result.user_message = path + ": удалено строк: " + std::to_string(stats.lines_removed) +
                          " из " + std::to_string(stats.lines_read) + ".";
    if (stats.lines_removed > 0) {
        Logger::info(result.user_message, kLogModule);
    } else {
        Logger::debug(result.user_message, kLogModule);
    }
    return result;
}
