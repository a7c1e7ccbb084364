#include "BankApp.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        bank::BankApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  simple_bank transfer v1.0.0" << std::endl;
        std::cout << "========================================" << std::endl;

        return app.run(argc, argv);

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
