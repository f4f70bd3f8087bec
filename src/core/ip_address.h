/*!
 * \file ip_address.h
 * \author Fedor Zilnitskiy
 * \brief Заголовочный файл для класса IPAddress, представляющего IPv4-адрес.
 */
#ifndef IP_ADDRESS_H
#define IP_ADDRESS_H

#include "common_defs.h" // Для std::string, std::array, std::ostream
#include <string>
#include <array>
#include <stdexcept>    // Для std::invalid_argument

/*!
 * \brief Класс для представления и валидации IPv4-адреса.
 *
 * Принимается только полная запись из четырех десятичных октетов "o1.o2.o3.o4".
 * Сокращенные формы, которые допускает inet_aton ("10.1", "0x7f.1"), отвергаются.
 */
class IPAddress final {
public:
    /*! \brief Конструктор по умолчанию (0.0.0.0). */
    IPAddress() noexcept;

    /*!
     * \brief Конструктор из четырех октетов.
     * \throw std::invalid_argument при невалидных значениях октетов.
     */
    IPAddress(int o1, int o2, int o3, int o4);

    /*!
     * \brief Разбирает строку вида "192.168.0.1".
     * \param text Строка с адресом. Пробелы, знаки и пустые октеты не допускаются.
     * \return Разобранный адрес.
     * \throw std::invalid_argument если строка не является корректным IPv4-адресом.
     */
    static IPAddress fromString(const std::string& text);

    /*!
     * \brief Проверяет строку без выброса исключения.
     * \return `true`, если `fromString(text)` завершится успешно.
     */
    static bool isValid(const std::string& text) noexcept;

    /*! \brief Преобразование IP-адреса в строку "o1.o2.o3.o4". */
    std::string toString() const;

    bool operator==(const IPAddress& other) const noexcept;
    bool operator!=(const IPAddress& other) const noexcept;

    friend std::ostream& operator<<(std::ostream& os, const IPAddress& ip);

private:
    std::array<unsigned char, 4> octets_{}; ///< Хранилище октетов IP-адреса.

    /*! \brief Проверка валидности одного октета (0-255). */
    static bool isValidOctet(int octet_val) noexcept;
    /*! \brief Валидация всех четырех октетов. */
    static void validateOctets(int o1, int o2, int o3, int o4);
};

#endif // IP_ADDRESS_H
