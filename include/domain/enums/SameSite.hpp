#pragma once

#include <string>
#include <stdexcept>
#include <cctype>

namespace websession::domain {

/**
 * @brief Значение атрибута SameSite у session cookie
 */
enum class SameSite {
    STRICT,  ///< Cookie не отправляется при переходах с чужих сайтов
    LAX,     ///< Отправляется при top-level навигации (по умолчанию)
    NONE     ///< Отправляется всегда, требует Secure
};

/**
 * @brief Преобразовать в значение атрибута Set-Cookie
 */
inline std::string toString(SameSite sameSite) {
    switch (sameSite) {
        case SameSite::STRICT: return "Strict";
        case SameSite::LAX:    return "Lax";
        case SameSite::NONE:   return "None";
    }
    return "Lax";
}

/**
 * @brief Создать из строки (регистр не важен)
 * @throws std::invalid_argument если строка не распознана
 */
inline SameSite sameSiteFromString(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "strict") return SameSite::STRICT;
    if (lower == "lax")    return SameSite::LAX;
    if (lower == "none")   return SameSite::NONE;
    throw std::invalid_argument("Unknown SameSite: " + str);
}

} // namespace websession::domain
