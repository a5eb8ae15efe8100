#pragma once

#include <stdexcept>
#include <string>

namespace websession::domain {

/**
 * @brief Не удалось получить случайные байты для идентификатора
 *
 * Фатальная ошибка: без CSPRNG сервис не может безопасно выдавать сессии.
 */
class IdentifierGenerationError : public std::runtime_error {
public:
    explicit IdentifierGenerationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Базовая ошибка хранилища сессий
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Хранилище недоступно (сеть, пул соединений, протокол)
 *
 * Запрос должен завершиться 5xx, а не продолжиться с пустой сессией.
 */
class StoreUnavailableError : public StoreError {
public:
    explicit StoreUnavailableError(const std::string& message)
        : StoreError(message) {}
};

/**
 * @brief Конфликт конкурентной записи
 *
 * Зарезервировано для backend'ов с оптимистичной проверкой версий.
 * Поставляемые backend'ы работают по last-writer-wins и его не бросают.
 */
class StoreConflictError : public StoreError {
public:
    explicit StoreConflictError(const std::string& message)
        : StoreError(message) {}
};

} // namespace websession::domain
