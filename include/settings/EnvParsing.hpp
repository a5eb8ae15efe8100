#pragma once

#include <stdexcept>
#include <string>

namespace websession::settings {

/**
 * @brief Целое из переменной окружения в диапазоне [min, max]
 * @throws std::invalid_argument если значение не число, с мусором в конце или вне диапазона
 */
inline long long parseIntInRange(const char* name, const std::string& value,
                                 long long min, long long max) {
    long long parsed = 0;
    size_t consumed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got: " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got: " + value);
    }
    if (parsed < min || parsed > max) {
        throw std::invalid_argument(std::string(name) + " must be in [" + std::to_string(min) +
                                    ", " + std::to_string(max) + "], got: " + value);
    }
    return parsed;
}

} // namespace websession::settings
