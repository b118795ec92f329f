#include "command.hpp"
#include "instrumentmanager.hpp"
#include "matchingengine.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace oceanbook;

namespace {

void runCommand(MatchingEngine& engine, const Command& command)
{
    if (command.action == Command::Action::Cancel) {
        bool cancelled = engine.cancel(command.symbol, command.orderId);
        std::cout << "{\"cancel\": " << command.orderId << ", \"status\": \""
                  << (cancelled ? "cancelled" : "not_found") << "\"}" << std::endl;
        return;
    }

    auto trades = engine.submit(command.order);
    for (const auto& trade : trades) {
        std::cout << formatTrade(trade) << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        // Configuration
        std::string configPath = "config/instruments.json";
        std::string ordersPath;

        // Parse args (minimal)
        if (argc > 1)
            configPath = argv[1];
        if (argc > 2)
            ordersPath = argv[2];

        std::cerr << "OceanBook Matching Engine" << std::endl;
        std::cerr << "Loading config from " << configPath << "..." << std::endl;

        InstrumentManager instruments;
        instruments.loadFromFile(configPath);
        std::cerr << "Loaded " << instruments.count() << " instruments." << std::endl;
        for (const auto& sym : instruments.allSymbols()) {
            std::cerr << " - " << sym << std::endl;
        }

        std::ifstream ordersFile;
        if (!ordersPath.empty()) {
            ordersFile.open(ordersPath);
            if (!ordersFile.is_open()) {
                throw std::runtime_error("Failed to open orders file: " + ordersPath);
            }
        }
        std::istream& input = ordersPath.empty() ? std::cin : ordersFile;

        MatchingEngine engine(instruments);

        std::string line;
        int lineNum = 0;
        while (std::getline(input, line)) {
            ++lineNum;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            try {
                runCommand(engine, parseCommand(line));
            } catch (const std::invalid_argument& e) {
                // Rejected input; the books are untouched
                std::cerr << "Line " << lineNum << " rejected: " << e.what() << std::endl;
            }
        }

        engine.shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
