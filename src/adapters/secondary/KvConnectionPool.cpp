#include "adapters/secondary/kv/KvConnectionPool.hpp"
#include "domain/errors/SessionErrors.hpp"
#include <iostream>
#include <stdexcept>

namespace websession::adapters::secondary {

KvConnectionPool::Lease::Lease(KvConnectionPool* pool,
                               std::unique_ptr<ports::output::IKvConnection> connection)
    : pool_(pool)
    , connection_(std::move(connection))
{}

KvConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_)
    , connection_(std::move(other.connection_))
    , valid_(other.valid_)
{
    other.pool_ = nullptr;
}

KvConnectionPool::Lease::~Lease() {
    if (pool_ && connection_) {
        pool_->release(std::move(connection_), valid_);
    }
}

KvConnectionPool::KvConnectionPool(KvConnectionFactory factory,
                                   size_t maxSize,
                                   std::chrono::milliseconds acquireTimeout)
    : factory_(std::move(factory))
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeout)
{
    if (!factory_) {
        throw std::invalid_argument("KvConnectionPool requires a connection factory");
    }
    if (maxSize_ == 0) {
        throw std::invalid_argument("KvConnectionPool size must be positive");
    }
    std::cout << "[KvConnectionPool] Created, maxSize=" << maxSize_
              << ", acquireTimeout=" << acquireTimeout_.count() << "ms" << std::endl;
}

KvConnectionPool::~KvConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
}

KvConnectionPool::Lease KvConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = available_.wait_for(lock, acquireTimeout_, [this]() {
        return !idle_.empty() || opened_ < maxSize_;
    });
    if (!ready) {
        std::cerr << "[KvConnectionPool] Exhausted: " << opened_ << " connections in use" << std::endl;
        throw domain::StoreUnavailableError("KV connection pool exhausted");
    }

    if (!idle_.empty()) {
        auto connection = std::move(idle_.back());
        idle_.pop_back();
        return Lease(this, std::move(connection));
    }

    // Резервируем слот и открываем соединение без блокировки
    ++opened_;
    lock.unlock();

    std::unique_ptr<ports::output::IKvConnection> connection;
    try {
        connection = factory_();
    } catch (const std::exception& e) {
        release(nullptr, false);
        std::cerr << "[KvConnectionPool] Connect failed: " << e.what() << std::endl;
        throw domain::StoreUnavailableError(std::string("KV backend unavailable: ") + e.what());
    }
    if (!connection) {
        release(nullptr, false);
        throw domain::StoreUnavailableError("KV connection factory returned no connection");
    }

    return Lease(this, std::move(connection));
}

size_t KvConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opened_;
}

size_t KvConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

void KvConnectionPool::release(std::unique_ptr<ports::output::IKvConnection> connection, bool valid) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (valid && connection) {
            idle_.push_back(std::move(connection));
        } else {
            --opened_;
        }
    }
    available_.notify_one();
}

} // namespace websession::adapters::secondary
