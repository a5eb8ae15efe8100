// include/SessionApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/SessionSettings.hpp"
#include "settings/KvSettings.hpp"
#include "settings/DbSettings.hpp"

// Ports
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IRandomSource.hpp"

// Application
#include "application/SessionMiddleware.hpp"

// Secondary Adapters
#include "adapters/secondary/OpenSslRandomSource.hpp"
#include "adapters/secondary/MemorySessionStore.hpp"
#include "adapters/secondary/PooledKvSessionStore.hpp"
#include "adapters/secondary/ExpirySweeper.hpp"
#include "adapters/secondary/kv/KvConnectionPool.hpp"
#include "adapters/secondary/kv/RedisConnection.hpp"
#include "adapters/secondary/kv/PostgresKvConnection.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/SessionHttpMiddleware.hpp"
#include "adapters/primary/VisitCounterHandler.hpp"
#include "adapters/primary/SessionLoginHandler.hpp"
#include "adapters/primary/SessionLogoutHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace websession
{

    /**
     * @brief Демонстрационный сервис с серверными сессиями
     *
     * Backend хранилища выбирается один раз при старте (SESSION_STORE):
     * - memory: MemorySessionStore + ExpirySweeper
     * - redis: PooledKvSessionStore над RedisConnection
     * - postgres: PooledKvSessionStore над PostgresKvConnection + ExpirySweeper
     */
    class SessionApp : public BoostBeastApplication
    {
    public:
        SessionApp() { std::cout << "[SessionApp] Initializing..." << std::endl; }
        ~SessionApp() override
        {
            if (sweeper_)
            {
                sweeper_->stop();
            }
            std::cout << "[SessionApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[SessionApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[SessionApp] Configuring DI..." << std::endl;

            // Шаг 1: Settings и backend хранилища
            auto settingsInjector = di::make_injector(
                di::bind<settings::SessionSettings>().in(di::singleton),
                di::bind<settings::KvSettings>().in(di::singleton),
                di::bind<settings::DbSettings>().in(di::singleton));

            auto sessionSettings = settingsInjector.create<std::shared_ptr<settings::SessionSettings>>();
            auto store = createStore(*sessionSettings,
                                     settingsInjector.create<std::shared_ptr<settings::KvSettings>>(),
                                     settingsInjector.create<std::shared_ptr<settings::DbSettings>>());

            // Шаг 2: Основной injector с instance binding для хранилища
            auto injector = di::make_injector(
                di::bind<ports::output::IRandomSource>().to<adapters::secondary::OpenSslRandomSource>().in(di::singleton),
                di::bind<ports::output::ISessionStore>().to(store));

            auto sessions = std::make_shared<application::SessionMiddleware>(
                injector.create<std::shared_ptr<ports::output::ISessionStore>>(),
                injector.create<std::shared_ptr<ports::output::IRandomSource>>(),
                sessionSettings->getConfig());

            // Шаг 3: HTTP Handlers
            handlers_[getHandlerKey("GET", "/api/v1/health")] =
                std::make_shared<adapters::primary::HealthHandler>(sessionSettings->getStore());

            handlers_[getHandlerKey("GET", "/api/v1/session/visits")] =
                std::make_shared<adapters::primary::SessionHttpMiddleware>(
                    sessions, injector.create<std::shared_ptr<adapters::primary::VisitCounterHandler>>());

            handlers_[getHandlerKey("POST", "/api/v1/session/login")] =
                std::make_shared<adapters::primary::SessionHttpMiddleware>(
                    sessions, injector.create<std::shared_ptr<adapters::primary::SessionLoginHandler>>());

            handlers_[getHandlerKey("POST", "/api/v1/session/logout")] =
                std::make_shared<adapters::primary::SessionHttpMiddleware>(
                    sessions, injector.create<std::shared_ptr<adapters::primary::SessionLogoutHandler>>());

            // Шаг 4: Фоновая очистка истёкших сессий
            if (sweeper_)
            {
                sweeper_->start(sessionSettings->getSweepInterval());
            }

            std::cout << "[SessionApp] Ready (store=" << sessionSettings->getStore() << ")" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::KvConnectionPool> pool_;
        std::unique_ptr<adapters::secondary::ExpirySweeper> sweeper_;

        std::shared_ptr<ports::output::ISessionStore> createStore(
            const settings::SessionSettings &sessionSettings,
            std::shared_ptr<settings::KvSettings> kvSettings,
            std::shared_ptr<settings::DbSettings> dbSettings)
        {
            std::chrono::milliseconds ttl = sessionSettings.getConfig().ttl;

            if (sessionSettings.getStore() == "redis")
            {
                pool_ = std::make_shared<adapters::secondary::KvConnectionPool>(
                    [kvSettings]() -> std::unique_ptr<ports::output::IKvConnection>
                    {
                        return std::make_unique<adapters::secondary::RedisConnection>(
                            kvSettings->getHost(), kvSettings->getPort(), kvSettings->getTimeout(),
                            kvSettings->getPassword(), kvSettings->getDb());
                    },
                    kvSettings->getPoolSize(), kvSettings->getTimeout());
                return std::make_shared<adapters::secondary::PooledKvSessionStore>(
                    pool_, ttl, kvSettings->getKeyPrefix());
            }

            if (sessionSettings.getStore() == "postgres")
            {
                // Схема создаётся один раз при старте
                adapters::secondary::PostgresKvConnection(dbSettings->getConnectionString()).ensureSchema();

                pool_ = std::make_shared<adapters::secondary::KvConnectionPool>(
                    [dbSettings]() -> std::unique_ptr<ports::output::IKvConnection>
                    {
                        return std::make_unique<adapters::secondary::PostgresKvConnection>(
                            dbSettings->getConnectionString());
                    },
                    kvSettings->getPoolSize(), kvSettings->getTimeout());

                auto connectionString = dbSettings->getConnectionString();
                sweeper_ = std::make_unique<adapters::secondary::ExpirySweeper>([connectionString]()
                    { return adapters::secondary::PostgresKvConnection(connectionString).purgeExpired(); });

                return std::make_shared<adapters::secondary::PooledKvSessionStore>(
                    pool_, ttl, kvSettings->getKeyPrefix());
            }

            auto memoryStore = std::make_shared<adapters::secondary::MemorySessionStore>(ttl);
            sweeper_ = std::make_unique<adapters::secondary::ExpirySweeper>([memoryStore]()
                { return memoryStore->purgeExpired(); });
            return memoryStore;
        }
    };

} // namespace websession
