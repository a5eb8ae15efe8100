#pragma once

#include <string>

namespace websession::domain {

/**
 * @brief Состояние сессии в пределах одного запроса
 *
 * Переходы:
 * - NEW -> ACTIVE (после первого сохранения)
 * - ACTIVE -> REGENERATED (выдача нового id с сохранением данных)
 * - любое -> DESTROYED (терминальное)
 */
enum class SessionState {
    NEW,          ///< Сессия создана в этом запросе, в хранилище её ещё нет
    ACTIVE,       ///< Сессия загружена из хранилища
    REGENERATED,  ///< При commit будет выдан новый id
    DESTROYED     ///< Сессия уничтожена, id больше не используется
};

inline std::string toString(SessionState state) {
    switch (state) {
        case SessionState::NEW:         return "NEW";
        case SessionState::ACTIVE:      return "ACTIVE";
        case SessionState::REGENERATED: return "REGENERATED";
        case SessionState::DESTROYED:   return "DESTROYED";
    }
    return "UNKNOWN";
}

/**
 * @brief Является ли состояние финальным
 */
inline bool isTerminal(SessionState state) {
    return state == SessionState::DESTROYED;
}

} // namespace websession::domain
