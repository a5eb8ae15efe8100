#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace websession::adapters::secondary {

using PurgeFunction = std::function<size_t()>;

/**
 * @brief Фоновый поток, периодически вычищающий истёкшие сессии
 *
 * Ленивое истечение в load() не трогает сессии, к которым больше никто
 * не обращается; sweeper не даёт им копиться в памяти.
 *
 * @example
 * ```cpp
 * auto store = std::make_shared<MemorySessionStore>(2h);
 * ExpirySweeper sweeper([store]() { return store->purgeExpired(); });
 * sweeper.start(60s);
 * // ...
 * sweeper.stop();
 * ```
 *
 * Thread-safe: да
 */
class ExpirySweeper {
public:
    explicit ExpirySweeper(PurgeFunction purge)
        : purge_(std::move(purge))
        , running_(false)
        , sweepCount_(0)
        , purgedTotal_(0)
    {
        if (!purge_) {
            throw std::invalid_argument("ExpirySweeper requires a purge function");
        }
    }

    ~ExpirySweeper() {
        stop();
    }

    // Non-copyable, non-movable
    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    /**
     * @brief Запустить фоновую очистку
     * @param interval Интервал между проходами
     */
    void start(std::chrono::milliseconds interval = std::chrono::seconds{60}) {
        if (running_.exchange(true)) {
            return;  // Уже запущен
        }

        interval_ = interval;

        workerThread_ = std::thread([this]() {
            runLoop();
        });
        std::cout << "[ExpirySweeper] Started, interval=" << interval.count() << "ms" << std::endl;
    }

    /**
     * @brief Остановить очистку. Не ждёт окончания интервала.
     */
    void stop() {
        {
            // Под mutex_, чтобы notify не проскочил между проверкой предиката и wait
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;  // Уже остановлен
            }
        }

        wakeup_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[ExpirySweeper] Stopped after " << sweepCount_.load() << " sweeps" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t sweepCount() const {
        return sweepCount_.load();
    }

    /**
     * @brief Сколько записей удалено за всё время
     */
    uint64_t purgedTotal() const {
        return purgedTotal_.load();
    }

    /**
     * @brief Выполнить один проход вручную (для тестов)
     */
    size_t sweepOnce() {
        return doSweep();
    }

private:
    PurgeFunction purge_;

    std::atomic<bool> running_;
    std::thread workerThread_;
    std::chrono::milliseconds interval_{std::chrono::seconds{60}};
    std::atomic<uint64_t> sweepCount_;
    std::atomic<uint64_t> purgedTotal_;

    std::mutex mutex_;
    std::condition_variable wakeup_;

    void runLoop() {
        while (running_.load()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wakeup_.wait_for(lock, interval_, [this]() { return !running_.load(); });
            }
            if (!running_.load()) {
                break;
            }

            try {
                doSweep();
            } catch (const std::exception& e) {
                // Поток не должен умирать из-за одного неудачного прохода
                std::cerr << "[ExpirySweeper] Sweep failed: " << e.what() << std::endl;
            }
        }
    }

    size_t doSweep() {
        size_t purged = purge_();
        purgedTotal_ += purged;
        ++sweepCount_;
        if (purged > 0) {
            std::cout << "[ExpirySweeper] Purged " << purged << " expired sessions" << std::endl;
        }
        return purged;
    }
};

} // namespace websession::adapters::secondary
