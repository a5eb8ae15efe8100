#pragma once

#include "domain/SessionId.hpp"
#include "domain/enums/SessionState.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace websession::application {

/**
 * @brief Изменяемое представление сессии в пределах одного запроса
 *
 * Создаётся SessionMiddleware::resolve(), живёт до commit(). Все изменения
 * локальны: другие запросы их не видят, пока middleware не сохранит сессию.
 *
 * Значения хранятся в JSON-объекте, типизированный доступ идёт через
 * преобразования nlohmann (to_json/from_json для пользовательских типов).
 *
 * @example
 * ```cpp
 * auto visits = session.getOr<int64_t>("visits", 0);
 * session.set("visits", visits + 1);
 * session.set("cart", std::vector<std::string>{"figi-1", "figi-2"});
 * ```
 */
class SessionHandle {
public:
    SessionHandle(domain::SessionId id,
                  domain::SessionState state,
                  nlohmann::json data = nlohmann::json::object())
        : id_(std::move(id))
        , state_(state)
        , data_(data.is_object() ? std::move(data) : nlohmann::json::object())
        , stored_(state == domain::SessionState::ACTIVE)
    {}

    const domain::SessionId& id() const { return id_; }
    domain::SessionState state() const { return state_; }
    bool isDirty() const { return dirty_; }
    bool isNew() const { return state_ == domain::SessionState::NEW; }
    bool isDestroyed() const { return state_ == domain::SessionState::DESTROYED; }

    /// Сессия была загружена из хранилища (а не создана в этом запросе)
    bool isStored() const { return stored_; }

    /**
     * @brief Прочитать значение
     * @return nullopt, если ключа нет или тип не совпадает
     */
    template <typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        try {
            return it->template get<T>();
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    template <typename T>
    T getOr(const std::string& key, T fallback) const {
        return get<T>(key).value_or(std::move(fallback));
    }

    bool has(const std::string& key) const {
        return data_.contains(key);
    }

    template <typename T>
    void set(const std::string& key, T&& value) {
        ensureAlive();
        data_[key] = std::forward<T>(value);
        dirty_ = true;
    }

    void remove(const std::string& key) {
        ensureAlive();
        data_.erase(key);
        dirty_ = true;
    }

    void clear() {
        ensureAlive();
        data_ = nlohmann::json::object();
        dirty_ = true;
    }

    /**
     * @brief Увеличить целочисленный счётчик (отсутствующий ключ = 0)
     * @return Новое значение
     */
    int64_t increment(const std::string& key, int64_t by = 1) {
        int64_t value = getOr<int64_t>(key, 0) + by;
        set(key, value);
        return value;
    }

    int64_t decrement(const std::string& key, int64_t by = 1) {
        return increment(key, -by);
    }

    /**
     * @brief Выдать сессии новый id при commit (данные сохраняются)
     *
     * Для новой сессии id и так будет выдан впервые, поэтому она только
     * помечается изменённой.
     */
    void regenerate() {
        ensureAlive();
        if (state_ == domain::SessionState::ACTIVE) {
            state_ = domain::SessionState::REGENERATED;
        }
        dirty_ = true;
    }

    /**
     * @brief Уничтожить сессию. Терминально.
     */
    void destroy() {
        data_ = nlohmann::json::object();
        state_ = domain::SessionState::DESTROYED;
        dirty_ = true;
    }

    const nlohmann::json& all() const { return data_; }

    std::string serialize() const { return data_.dump(); }

private:
    domain::SessionId id_;
    domain::SessionState state_;
    nlohmann::json data_;
    bool stored_;
    bool dirty_ = false;

    void ensureAlive() const {
        if (domain::isTerminal(state_)) {
            throw std::logic_error("Session is destroyed");
        }
    }
};

} // namespace websession::application
