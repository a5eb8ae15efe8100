#include "application/SessionMiddleware.hpp"
#include "domain/errors/SessionErrors.hpp"
#include <iostream>
#include <stdexcept>

namespace websession::application {

using domain::SessionState;

SessionMiddleware::SessionMiddleware(std::shared_ptr<ports::output::ISessionStore> store,
                                     std::shared_ptr<ports::output::IRandomSource> randomSource,
                                     domain::SessionConfig config)
    : store_(std::move(store))
    , generator_(std::move(randomSource), config.idByteLength)
    , codec_(std::move(config))
{
    if (!store_) {
        throw std::invalid_argument("SessionMiddleware requires a session store");
    }
    std::cout << "[SessionMiddleware] Created (cookie=" << codec_.config().cookieName
              << ", ttl=" << codec_.config().ttl.count() << "s"
              << ", sliding=" << (codec_.config().slidingExpiry ? "on" : "off") << ")" << std::endl;
}

SessionHandle SessionMiddleware::resolve(const std::optional<std::string>& cookieHeader) const {
    if (!cookieHeader || cookieHeader->empty()) {
        return startNew();
    }

    auto id = codec_.decode(*cookieHeader);
    if (!id) {
        // Нет cookie или мусор в значении: просто новая анонимная сессия
        return startNew();
    }

    // StoreUnavailableError летит наружу
    auto record = store_->load(*id);
    if (!record) {
        return startNew();
    }

    auto data = nlohmann::json::parse(record->payload, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        std::cerr << "[SessionMiddleware] Corrupted payload for session "
                  << id->masked() << ", starting a new one" << std::endl;
        return startNew();
    }

    return SessionHandle(record->id, SessionState::ACTIVE, std::move(data));
}

SessionOutcome SessionMiddleware::commit(const SessionHandle& session) const {
    SessionOutcome outcome;

    switch (session.state()) {
        case SessionState::NEW: {
            if (!session.isDirty()) {
                return outcome;
            }
            store_->save(domain::SessionRecord(session.id(), session.serialize()));
            std::cout << "[SessionMiddleware] Session created: " << session.id().masked() << std::endl;
            outcome.setCookie = issueCookie(session.id());
            outcome.storedId = session.id();
            return outcome;
        }

        case SessionState::ACTIVE: {
            if (session.isDirty()) {
                if (!store_->replace(domain::SessionRecord(session.id(), session.serialize()))) {
                    // Запись удалена или истекла, пока шёл запрос: не воскрешаем
                    std::cout << "[SessionMiddleware] Session " << session.id().masked()
                              << " vanished during request, dropping changes" << std::endl;
                    outcome.setCookie = codec_.removal();
                    return outcome;
                }
                outcome.setCookie = issueCookie(session.id());
                outcome.storedId = session.id();
                return outcome;
            }

            if (codec_.config().slidingExpiry) {
                if (!store_->touch(session.id())) {
                    outcome.setCookie = codec_.removal();
                    return outcome;
                }
                outcome.setCookie = issueCookie(session.id());
            }
            outcome.storedId = session.id();
            return outcome;
        }

        case SessionState::REGENERATED: {
            auto newId = generator_.generate();
            auto payload = session.serialize();
            // Старый id перестаёт действовать до записи нового
            store_->remove(session.id());
            store_->save(domain::SessionRecord(newId, payload));
            std::cout << "[SessionMiddleware] Session regenerated: " << session.id().masked()
                      << " -> " << newId.masked() << std::endl;
            outcome.setCookie = issueCookie(newId);
            outcome.storedId = newId;
            return outcome;
        }

        case SessionState::DESTROYED: {
            if (session.isStored()) {
                store_->remove(session.id());
                std::cout << "[SessionMiddleware] Session destroyed: " << session.id().masked() << std::endl;
            }
            outcome.setCookie = codec_.removal();
            return outcome;
        }
    }

    return outcome;
}

SessionHandle SessionMiddleware::startNew() const {
    return SessionHandle(generator_.generate(), SessionState::NEW);
}

std::string SessionMiddleware::issueCookie(const domain::SessionId& id) const {
    const auto& config = codec_.config();
    std::optional<std::chrono::seconds> maxAge;
    if (config.persistentCookie) {
        maxAge = config.ttl;
    }
    return codec_.encode(id, maxAge, false);
}

} // namespace websession::application
