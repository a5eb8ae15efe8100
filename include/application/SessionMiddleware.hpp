#pragma once

#include "application/CookieCodec.hpp"
#include "application/IdentifierGenerator.hpp"
#include "application/SessionHandle.hpp"
#include "domain/SessionConfig.hpp"
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IRandomSource.hpp"
#include <memory>
#include <optional>
#include <string>

namespace websession::application {

/**
 * @brief Результат commit() для одного запроса
 */
struct SessionOutcome {
    std::optional<std::string> setCookie;          ///< Значение Set-Cookie (nullopt = заголовок не нужен)
    std::optional<domain::SessionId> storedId;     ///< Id, под которым сессия лежит в хранилище после commit
};

/**
 * @brief Жизненный цикл сессии вокруг обработки запроса
 *
 * resolve() на входе: cookie -> load -> SessionHandle (существующая или новая).
 * commit() на выходе: save/replace/touch/remove + Set-Cookie.
 *
 * Новая сессия без изменений не сохраняется и cookie не получает (lazy creation).
 * Недоступность хранилища пробрасывается как domain::StoreUnavailableError:
 * запрос должен завершиться 5xx, а не продолжиться с выдуманной пустой сессией.
 *
 * Thread-safe: один экземпляр обслуживает все запросы.
 */
class SessionMiddleware {
public:
    SessionMiddleware(std::shared_ptr<ports::output::ISessionStore> store,
                      std::shared_ptr<ports::output::IRandomSource> randomSource,
                      domain::SessionConfig config = {});

    /**
     * @brief Найти сессию по заголовку Cookie или начать новую
     * @throws domain::StoreUnavailableError
     * @throws domain::IdentifierGenerationError
     */
    SessionHandle resolve(const std::optional<std::string>& cookieHeader) const;

    /**
     * @brief Сохранить изменения сессии и построить Set-Cookie
     *
     * Вызывается один раз в конце запроса.
     * @throws domain::StoreUnavailableError (Set-Cookie в этом случае не выдаётся)
     */
    SessionOutcome commit(const SessionHandle& session) const;

    /**
     * @brief resolve() -> handler(session) -> commit()
     *
     * Если handler бросил исключение, commit не выполняется.
     */
    template <typename Handler>
    SessionOutcome handle(const std::optional<std::string>& cookieHeader, Handler&& handler) const {
        auto session = resolve(cookieHeader);
        std::forward<Handler>(handler)(session);
        return commit(session);
    }

    const CookieCodec& codec() const { return codec_; }
    const domain::SessionConfig& config() const { return codec_.config(); }

private:
    std::shared_ptr<ports::output::ISessionStore> store_;
    IdentifierGenerator generator_;
    CookieCodec codec_;

    SessionHandle startNew() const;
    std::string issueCookie(const domain::SessionId& id) const;
};

} // namespace websession::application
