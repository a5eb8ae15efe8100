#pragma once

#include "domain/SessionId.hpp"
#include "domain/SessionRecord.hpp"
#include <optional>
#include <chrono>

namespace websession::ports::output {

/**
 * @brief Интерфейс хранилища сессий
 *
 * Все операции потокобезопасны. Недоступность backend'а сообщается через
 * domain::StoreUnavailableError, отсутствие записи ошибкой не является.
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /**
     * @brief Загрузить запись
     * @return nullopt, если записи нет или она истекла
     * @throws domain::StoreUnavailableError
     */
    virtual std::optional<domain::SessionRecord> load(const domain::SessionId& id) = 0;

    /**
     * @brief Upsert записи, expiresAt = now + ttl()
     * @return Сохранённая запись
     */
    virtual domain::SessionRecord save(const domain::SessionRecord& record) = 0;

    /**
     * @brief Перезаписать только существующую живую запись
     *
     * Не воскрешает id, удалённый конкурентным запросом.
     * @return false, если записи нет (ничего не записано)
     */
    virtual bool replace(const domain::SessionRecord& record) = 0;

    /**
     * @brief Удалить запись (идемпотентно)
     */
    virtual void remove(const domain::SessionId& id) = 0;

    /**
     * @brief Продлить TTL без перезаписи payload
     * @return false, если записи нет
     */
    virtual bool touch(const domain::SessionId& id) = 0;

    virtual std::chrono::milliseconds ttl() const = 0;
};

} // namespace websession::ports::output
