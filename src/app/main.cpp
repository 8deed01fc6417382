/**
 * @file main.cpp
 * @brief Точка входа conic
 */

#include "runner.hpp"
#include <exception>
#include <stdexcept>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        const auto options = conic::app::parseCommandLine(argc, argv);
        if (options.show_help) {
            std::cout << conic::app::usageText();
            return 0;
        }

        const auto result = conic::app::runCommand(options, std::cout, std::cerr);
        return result.exit_code;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Ошибка: " << e.what() << "\n\n" << conic::app::usageText();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Ошибка: " << e.what() << std::endl;
        return 1;
    }
}
