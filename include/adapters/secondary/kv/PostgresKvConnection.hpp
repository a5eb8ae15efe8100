#pragma once

#include "ports/output/IKvConnection.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

namespace websession::adapters::secondary {

/**
 * @brief KV поверх PostgreSQL: таблица session_kv с колонкой expires_at
 *
 * Истёкшие строки невидимы для GET/XX сразу, физически их удаляет
 * purgeExpired() (см. ExpirySweeper).
 *
 * Одно соединение pqxx на экземпляр, без мьютекса: экземпляром владеет
 * арендатор из KvConnectionPool. Ошибки pqxx летят наружу как есть,
 * PooledKvSessionStore закрывает такое соединение.
 *
 * Зависимости:
 * - libpqxx (pkg-config: libpqxx)
 * - PostgreSQL 15+
 */
class PostgresKvConnection : public ports::output::IKvConnection {
public:
    /**
     * @param connectionString Формат: "host=localhost port=5432 dbname=session_db user=... password=..."
     * @throws ports::output::KvConnectionError если не удалось подключиться
     */
    explicit PostgresKvConnection(const std::string& connectionString) {
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresKv] Connection failed: " << e.what() << std::endl;
            throw ports::output::KvConnectionError(std::string("PostgreSQL connection failed: ") + e.what());
        }
        std::cout << "[PostgresKv] Connected to " << connection_->dbname() << std::endl;
    }

    ~PostgresKvConnection() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    /**
     * @brief Создать таблицу и индекс, если их нет
     */
    void ensureSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS session_kv (
                key        TEXT PRIMARY KEY,
                value      TEXT NOT NULL,
                expires_at TIMESTAMPTZ NOT NULL
            )
        )");
        txn.exec("CREATE INDEX IF NOT EXISTS session_kv_expires_at_idx ON session_kv (expires_at)");
        txn.commit();
        std::cout << "[PostgresKv] Schema ready" << std::endl;
    }

    std::optional<std::string> get(const std::string& key) override {
        pqxx::work txn(*connection_);

        auto result = txn.exec_params(
            "SELECT value FROM session_kv WHERE key = $1 AND expires_at > NOW()",
            key
        );

        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }
        return result[0][0].as<std::string>();
    }

    bool set(const std::string& key,
             const std::string& value,
             std::chrono::milliseconds ttl,
             ports::output::SetCondition condition = ports::output::SetCondition::ALWAYS) override {
        pqxx::work txn(*connection_);
        pqxx::result result;
        int64_t ttlMs = ttl.count();

        switch (condition) {
            case ports::output::SetCondition::ALWAYS:
                // UPSERT: INSERT ... ON CONFLICT DO UPDATE
                result = txn.exec_params(
                    R"(
                        INSERT INTO session_kv (key, value, expires_at)
                        VALUES ($1, $2, NOW() + make_interval(secs => $3::double precision / 1000.0))
                        ON CONFLICT (key) DO UPDATE SET
                            value = EXCLUDED.value,
                            expires_at = EXCLUDED.expires_at
                    )",
                    key, value, ttlMs
                );
                break;

            case ports::output::SetCondition::IF_EXISTS:
                result = txn.exec_params(
                    R"(
                        UPDATE session_kv SET
                            value = $2,
                            expires_at = NOW() + make_interval(secs => $3::double precision / 1000.0)
                        WHERE key = $1 AND expires_at > NOW()
                    )",
                    key, value, ttlMs
                );
                break;

            case ports::output::SetCondition::IF_ABSENT:
                // Истёкшая строка считается отсутствующей
                result = txn.exec_params(
                    R"(
                        INSERT INTO session_kv (key, value, expires_at)
                        VALUES ($1, $2, NOW() + make_interval(secs => $3::double precision / 1000.0))
                        ON CONFLICT (key) DO UPDATE SET
                            value = EXCLUDED.value,
                            expires_at = EXCLUDED.expires_at
                        WHERE session_kv.expires_at <= NOW()
                    )",
                    key, value, ttlMs
                );
                break;
        }

        txn.commit();
        return result.affected_rows() > 0;
    }

    bool del(const std::string& key) override {
        pqxx::work txn(*connection_);

        auto result = txn.exec_params(
            "DELETE FROM session_kv WHERE key = $1",
            key
        );

        txn.commit();
        return result.affected_rows() > 0;
    }

    bool pexpire(const std::string& key, std::chrono::milliseconds ttl) override {
        pqxx::work txn(*connection_);

        auto result = txn.exec_params(
            R"(
                UPDATE session_kv SET
                    expires_at = NOW() + make_interval(secs => $2::double precision / 1000.0)
                WHERE key = $1 AND expires_at > NOW()
            )",
            key, static_cast<int64_t>(ttl.count())
        );

        txn.commit();
        return result.affected_rows() > 0;
    }

    bool ping() override {
        pqxx::nontransaction txn(*connection_);
        auto result = txn.exec("SELECT 1");
        return !result.empty();
    }

    /**
     * @brief Физически удалить истёкшие строки
     * @return Количество удалённых
     */
    size_t purgeExpired() {
        pqxx::work txn(*connection_);
        auto result = txn.exec("DELETE FROM session_kv WHERE expires_at <= NOW()");
        txn.commit();
        return static_cast<size_t>(result.affected_rows());
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
};

} // namespace websession::adapters::secondary
