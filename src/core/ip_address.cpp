/*!
 * \file ip_address.cpp
 * \author Fedor Zilnitskiy
 * \brief Реализация класса IPAddress для работы с IPv4-адресами.
 */
#include "ip_address.h"
#include <sstream>      // Для std::ostringstream при конвертации в строку

bool IPAddress::isValidOctet(int octet_val) noexcept {
    return octet_val >= 0 && octet_val <= 255;
}

/*!
 * \brief Валидирует все четыре октета.
 * \throw std::invalid_argument Если хотя бы один октет невалиден.
 */
void IPAddress::validateOctets(int o1, int o2, int o3, int o4) {
    if (!isValidOctet(o1) || !isValidOctet(o2) || !isValidOctet(o3) || !isValidOctet(o4)) {
        std::ostringstream ss;
        ss << "Некорректные значения октетов IP-адреса: "
           << o1 << "." << o2 << "." << o3 << "." << o4
           << ". Каждый октет должен быть в диапазоне от 0 до 255.";
        throw std::invalid_argument(ss.str());
    }
}

IPAddress::IPAddress() noexcept : octets_{{0, 0, 0, 0}} {
}

IPAddress::IPAddress(int o1, int o2, int o3, int o4) {
    validateOctets(o1, o2, o3, o4); // Выбрасывает исключение при ошибке
    octets_[0] = static_cast<unsigned char>(o1);
    octets_[1] = static_cast<unsigned char>(o2);
    octets_[2] = static_cast<unsigned char>(o3);
    octets_[3] = static_cast<unsigned char>(o4);
}

/*!
 * \brief Разбирает строку "o1.o2.o3.o4".
 *
 * Каждый октет: от 1 до 3 десятичных цифр без ведущих нулей (кроме самого "0").
 * Запрет ведущих нулей убирает неоднозначность "010" (восьмеричное 8 для inet_aton),
 * так что строковое представление адреса всегда совпадает с введенным текстом.
 */
IPAddress IPAddress::fromString(const std::string& text) {
    const std::string error_prefix = "Некорректный IPv4-адрес '" + text + "': ";
    std::array<int, 4> parsed{};
    size_t octet_index = 0;
    size_t pos = 0;

    while (true) {
        if (octet_index >= parsed.size()) {
            throw std::invalid_argument(error_prefix + "ожидается ровно четыре октета.");
        }
        size_t dot_pos = text.find('.', pos);
        std::string part = text.substr(pos, dot_pos == std::string::npos ? std::string::npos : dot_pos - pos);

        if (part.empty()) {
            throw std::invalid_argument(error_prefix + "пустой октет.");
        }
        if (part.size() > 3) {
            throw std::invalid_argument(error_prefix + "октет '" + part + "' слишком длинный.");
        }
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::invalid_argument(error_prefix + "октет '" + part + "' содержит недопустимый символ.");
            }
        }
        if (part.size() > 1 && part[0] == '0') {
            throw std::invalid_argument(error_prefix + "октет '" + part + "' содержит ведущий ноль.");
        }
        parsed[octet_index++] = std::stoi(part); // не более 3 цифр, переполнение невозможно

        if (dot_pos == std::string::npos) {
            break;
        }
        pos = dot_pos + 1;
    }

    if (octet_index != parsed.size()) {
        throw std::invalid_argument(error_prefix + "ожидается ровно четыре октета.");
    }
    return IPAddress(parsed[0], parsed[1], parsed[2], parsed[3]);
}

bool IPAddress::isValid(const std::string& text) noexcept {
    try {
        fromString(text);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string IPAddress::toString() const {
    std::ostringstream oss;
    oss << static_cast<int>(octets_[0]) << "."
        << static_cast<int>(octets_[1]) << "."
        << static_cast<int>(octets_[2]) << "."
        << static_cast<int>(octets_[3]);
    return oss.str();
}

bool IPAddress::operator==(const IPAddress& other) const noexcept {
    return octets_ == other.octets_;
}

bool IPAddress::operator!=(const IPAddress& other) const noexcept {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const IPAddress& ip) {
    os << ip.toString();
    return os;
}
