#pragma once

#include <boost/asio.hpp>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace websession::adapters::primary {

/**
 * @brief Ожидание SIGINT/SIGTERM в отдельном потоке
 *
 * Сигнал принимает boost::asio::signal_set, а callback выполняется в обычном
 * потоке, поэтому в нём можно логировать и останавливать сервер.
 * Callback вызывается не более одного раза.
 */
class ShutdownSignals {
public:
    using Callback = std::function<void(int)>;

    explicit ShutdownSignals(Callback onSignal,
                             std::initializer_list<int> signals = {SIGINT, SIGTERM})
        : onSignal_(std::move(onSignal))
        , signals_(ioContext_)
    {
        if (!onSignal_) {
            throw std::invalid_argument("ShutdownSignals requires a callback");
        }
        for (int signal : signals) {
            signals_.add(signal);
        }
        signals_.async_wait([this](const boost::system::error_code& error, int signal) {
            if (error) {
                return;  // cancel() из деструктора
            }
            std::cout << "[ShutdownSignals] Received signal " << signal << std::endl;
            onSignal_(signal);
        });
        worker_ = std::thread([this]() { ioContext_.run(); });
    }

    ~ShutdownSignals() {
        boost::system::error_code ignored;
        signals_.cancel(ignored);
        ioContext_.stop();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

private:
    Callback onSignal_;
    boost::asio::io_context ioContext_;
    boost::asio::signal_set signals_;
    std::thread worker_;
};

} // namespace websession::adapters::primary
