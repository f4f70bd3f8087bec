/*!
 * \file undeny_config.cpp
 * \author Fedor Zilnitskiy
 * \brief Реализация класса UndenyConfig.
 */
#include "undeny_config.h"
#include "logger.h"

#include <fstream>
#include <algorithm> // Для std::transform
#include <iostream>  // Для UndenyConfig::printHelp
#include <filesystem>

// Вспомогательная функция для удаления начальных и конечных пробельных символов
static std::string trimStringUC(const std::string& str) {
    const std::string whitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, (end - start + 1));
}

static std::string toUpperUC(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}

// Разбор восьмеричного режима доступа ("644", "0644"). Бросает std::invalid_argument / std::out_of_range.
static unsigned int parseOctalMode(const std::string& value) {
    size_t idx = 0;
    unsigned long mode = std::stoul(value, &idx, 8);
    if (idx != value.size()) {
        throw std::invalid_argument("режим доступа должен быть восьмеричным числом, получено: " + value);
    }
    if (mode > 0777) {
        throw std::out_of_range("режим доступа должен быть не больше 0777, получено: " + value);
    }
    return static_cast<unsigned int>(mode);
}

static int parseTimeoutSeconds(const std::string& value) {
    size_t idx = 0;
    int seconds = std::stoi(value, &idx);
    if (idx != value.size()) {
        throw std::invalid_argument("ожидается целое число секунд, получено: " + value);
    }
    if (seconds < 1 || seconds > MAX_SERVICE_TIMEOUT_SECONDS) {
        throw std::out_of_range("таймаут должен быть в диапазоне 1-" + std::to_string(MAX_SERVICE_TIMEOUT_SECONDS) + ", получено: " + value);
    }
    return seconds;
}

bool UndenyConfig::loadFromFile(const std::string& config_filename, bool required) {
    const std::string cfg_log_prefix = "[Конфигурация] ";
    std::ifstream configFile(config_filename);
    if (!configFile.is_open()) {
        if (required) {
            Logger::error(cfg_log_prefix + "Не удалось открыть файл конфигурации '" + config_filename + "'.");
            return false;
        }
        Logger::debug(cfg_log_prefix + "Файл конфигурации '" + config_filename + "' не найден. Используются значения по умолчанию.");
        return true;
    }
    Logger::debug(cfg_log_prefix + "Загрузка конфигурации из файла '" + config_filename + "'.");

    // Значения применяются только после успешного разбора всего файла
    UndenyConfig staged = *this;
    bool target_list_replaced = false;
    std::string line_content;
    int line_num = 0;

    while (std::getline(configFile, line_content)) {
        line_num++;

        size_t comment_pos_inline = line_content.find('#');
        if (comment_pos_inline != std::string::npos) {
            line_content = line_content.substr(0, comment_pos_inline);
        }

        std::string trimmed_line = trimStringUC(line_content);
        if (trimmed_line.empty()) {
            continue;
        }

        size_t equal_pos = trimmed_line.find('=');
        if (equal_pos == std::string::npos) {
            Logger::warn(cfg_log_prefix + "Пропущена некорректная строка " + std::to_string(line_num) + " в файле '" + config_filename + "' (не в формате ключ=значение): \"" + trimmed_line + "\"");
            continue;
        }

        std::string key = trimStringUC(trimmed_line.substr(0, equal_pos));
        std::string value = trimStringUC(trimmed_line.substr(equal_pos + 1));
        if (key.empty()) {
            Logger::warn(cfg_log_prefix + "Пропущена строка " + std::to_string(line_num) + " в файле '" + config_filename + "' (пустой ключ).");
            continue;
        }

        const std::string where = " в файле '" + config_filename + "' (строка " + std::to_string(line_num) + ")";
        std::string key_upper = toUpperUC(key);

        try {
            if (key_upper == "LOG_FILE_PATH") {
                if (value.empty()) {
                    Logger::error(cfg_log_prefix + "Пустое значение для ключа 'LOG_FILE_PATH'" + where + ".");
                    return false;
                }
                staged.log_file_path = value;
            } else if (key_upper == "LOG_LEVEL") {
                if (!Logger::parseLevel(value, staged.log_level)) {
                    Logger::warn(cfg_log_prefix + "Неизвестное значение '" + value + "' для LOG_LEVEL" + where + ". Используется текущее значение.");
                }
            } else if (key_upper == "SERVICE_NAME") {
                if (value.empty()) {
                    Logger::error(cfg_log_prefix + "Пустое значение для ключа 'SERVICE_NAME'" + where + ".");
                    return false;
                }
                staged.service_name = value;
            } else if (key_upper == "SERVICE_CONTROL_COMMAND") {
                if (value.empty()) {
                    Logger::error(cfg_log_prefix + "Пустое значение для ключа 'SERVICE_CONTROL_COMMAND'" + where + ".");
                    return false;
                }
                staged.service_control_command = value;
            } else if (key_upper == "SERVICE_TIMEOUT_SECONDS") {
                staged.service_timeout_seconds = parseTimeoutSeconds(value);
            } else if (key_upper == "TARGET_FILE") {
                if (value.empty()) {
                    Logger::error(cfg_log_prefix + "Пустое значение для ключа 'TARGET_FILE'" + where + ".");
                    return false;
                }
                if (!target_list_replaced) {
                    staged.target_files.clear();
                    target_list_replaced = true;
                }
                staged.target_files.push_back(value);
            } else if (key_upper == "BACKUP_SUFFIX") {
                if (value.empty()) {
                    // Пустой суффикс сделал бы резервную копию самим исходным файлом
                    Logger::error(cfg_log_prefix + "Пустое значение для ключа 'BACKUP_SUFFIX'" + where + ".");
                    return false;
                }
                staged.backup_suffix = value;
            } else if (key_upper == "TARGET_FILE_MODE") {
                staged.target_file_mode = parseOctalMode(value);
            } else if (key_upper == "SCRATCH_DIR") {
                staged.scratch_dir = value;
            } else if (key_upper == "LOCK_FILE_PATH") {
                staged.lock_file_path = value;
            } else {
                Logger::warn(cfg_log_prefix + "Неизвестный ключ '" + key + "'" + where + ". Ключ проигнорирован.");
            }
        } catch (const std::invalid_argument& e_ia) {
            Logger::error(cfg_log_prefix + "Ошибка разбора значения для ключа '" + key + "' (значение: '" + value + "')" + where + ": " + e_ia.what());
            return false;
        } catch (const std::out_of_range& e_oor) {
            Logger::error(cfg_log_prefix + "Значение для ключа '" + key + "' (значение: '" + value + "')" + where + " выходит за допустимый диапазон: " + e_oor.what());
            return false;
        }
    }

    *this = staged;
    Logger::debug(cfg_log_prefix + "Конфигурация из файла '" + config_filename + "' загружена.");
    return true;
}

SanitizerOptions UndenyConfig::sanitizerOptions() const {
    SanitizerOptions options;
    options.backup_suffix = backup_suffix;
    options.target_mode = target_file_mode;
    options.scratch_dir = scratch_dir;
    return options;
}

void UndenyConfig::printHelp(const char* app_name_char) {
    std::string app_name = (app_name_char && app_name_char[0] != '\0') ? app_name_char : "undeny";
    const UndenyConfig defaults;
    std::cout << "\nИспользование: sudo " << app_name << " [опции] <IPv4-адрес>\n";
    std::cout << "Удаляет адрес из файлов DenyHosts: останавливает службу, удаляет строки с адресом\n"
              << "из каждого файла (сохраняя копию '<файл>" << defaults.backup_suffix << "') и снова запускает службу.\n"
              << "Адрес должен быть полным: четыре десятичных октета, например 192.168.1.10.\n";
    std::cout << "Опции:\n";
    std::cout << "  -c, --config <файл>         Файл конфигурации. По умолчанию: '" << DEFAULT_CONFIG_FILE << "' (если существует).\n";
    std::cout << "  -l, --log-level <УРОВЕНЬ>   Уровень журналирования (DEBUG, INFO, WARN, ERROR, NONE). По умолчанию: INFO.\n";
    std::cout << "  --log-file <путь>           Файл журнала. По умолчанию: '" << defaults.log_file_path << "'.\n";
    std::cout << "  -h, --help                  Показать эту справку и выйти.\n";
    std::cout << "Файлы, обрабатываемые по умолчанию (по порядку):\n";
    for (const auto& file : defaults.target_files) {
        std::cout << "  " << file << "\n";
    }
    std::cout << std::endl;
}

bool UndenyConfig::parseCommandLineArgs(int argc, char* argv[], const std::string& default_config_path) {
    const std::string cla_log_prefix = "[Аргументы] ";
    const char* app_name = (argc > 0) ? argv[0] : "undeny";

    // Первый проход: файл конфигурации, чтобы опции командной строки имели приоритет над ним
    std::string config_file_from_args;
    for (int i = 1; i < argc; ++i) {
        std::string arg_str = argv[i];
        if (arg_str == "-c" || arg_str == "--config") {
            if (i + 1 >= argc) {
                Logger::error(cla_log_prefix + "Опция '" + arg_str + "' требует аргумент (путь к файлу).");
                printHelp(app_name);
                return false;
            }
            config_file_from_args = argv[i + 1];
            break;
        }
    }

    if (!config_file_from_args.empty()) {
        if (!loadFromFile(config_file_from_args, true)) {
            config_load_failed = true;
            Logger::error(cla_log_prefix + "Ошибка загрузки файла конфигурации '" + config_file_from_args + "'.");
            return false;
        }
    } else if (!default_config_path.empty()) {
        if (!loadFromFile(default_config_path, false)) {
            config_load_failed = true;
            Logger::error(cla_log_prefix + "Ошибка загрузки файла конфигурации '" + default_config_path + "'.");
            return false;
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-c" || arg == "--config") {
            ++i; // уже обработано в первом проходе
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                Logger::error(cla_log_prefix + "Опция '" + arg + "' требует аргумент (уровень журналирования).");
                printHelp(app_name);
                return false;
            }
            std::string level_str_arg = argv[++i];
            if (!Logger::parseLevel(level_str_arg, log_level)) {
                Logger::error(cla_log_prefix + "Неизвестный уровень журналирования '" + level_str_arg + "'.");
                printHelp(app_name);
                return false;
            }
        } else if (arg == "--log-file") {
            if (i + 1 >= argc || argv[i + 1][0] == '\0') {
                Logger::error(cla_log_prefix + "Опция '" + arg + "' требует аргумент (путь к файлу).");
                printHelp(app_name);
                return false;
            }
            log_file_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            help_requested = true;
            printHelp(app_name);
            return false;
        } else if (arg.size() > 1 && arg[0] == '-') {
            Logger::error(cla_log_prefix + "Неизвестная опция: " + arg);
            printHelp(app_name);
            return false;
        } else {
            positional_args.push_back(arg);
        }
    }
    return true;
}
