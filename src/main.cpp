#include "SessionApp.hpp"
#include "adapters/primary/ShutdownSignals.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        websession::SessionApp app;

        // Graceful shutdown в Kubernetes: stop() вызывается из потока ShutdownSignals,
        // а не из обработчика сигнала
        websession::adapters::primary::ShutdownSignals signals([&app](int) {
            std::cout << "[main] Shutting down..." << std::endl;
            app.stop();
        });

        std::cout << "========================================" << std::endl;
        std::cout << "  Session Service v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // loadEnvironment() -> configureInjection() -> start()
        app.run(argc, argv);

        std::cout << "[main] Session Service stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
