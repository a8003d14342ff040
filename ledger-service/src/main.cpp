#include "LedgerApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        ledger::LedgerApp app;

        std::cerr << "========================================" << std::endl;
        std::cerr << "  Ledger CLI v1.0.0" << std::endl;
        std::cerr << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        int code = app.run(argc, argv);

        std::cerr << "[main] Ledger CLI finished with code " << code << std::endl;
        return code;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
