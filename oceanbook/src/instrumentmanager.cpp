#include "instrumentmanager.hpp"
#include "jsonutils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace oceanbook {

using namespace json;

void InstrumentManager::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open instruments file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    // Parse array of instrument objects
    // Find each { ... } block
    size_t pos = 0;
    while (pos < json.size()) {
        auto objectStart = json.find('{', pos);
        if (objectStart == std::string::npos) {
            break;
        }

        auto objectEnd = json.find('}', objectStart);
        if (objectEnd == std::string::npos) {
            break;
        }

        std::string objectJson = json.substr(objectStart, objectEnd - objectStart + 1);

        Instrument instrument{};
        instrument.symbol = extractString(objectJson, "symbol");
        instrument.description = extractString(objectJson, "description");

        // Increments are read from their text, never through a double
        instrument.tickSize = extractDecimal(objectJson, "tick_size").value_or(Decimal(1));
        instrument.lotSize = extractDecimal(objectJson, "lot_size").value_or(Decimal(1));

        if (!instrument.tickSize.isPositive() || !instrument.lotSize.isPositive()) {
            throw std::runtime_error("Instrument " + instrument.symbol + " in " + path +
                                     " needs positive tick_size and lot_size");
        }

        if (!instrument.symbol.empty()) {
            m_instruments[instrument.symbol] = std::move(instrument);
        }

        pos = objectEnd + 1;
    }
}

void InstrumentManager::addInstrument(Instrument instrument)
{
    m_instruments[instrument.symbol] = std::move(instrument);
}

const Instrument* InstrumentManager::find(const std::string& symbol) const
{
    auto iterator = m_instruments.find(symbol);
    if (iterator == m_instruments.end()) {
        return nullptr;
    }
    return &iterator->second;
}

std::vector<std::string> InstrumentManager::allSymbols() const
{
    std::vector<std::string> symbols;
    symbols.reserve(m_instruments.size());
    for (const auto& [symbol, instrument] : m_instruments) {
        symbols.push_back(symbol);
    }
    std::sort(symbols.begin(), symbols.end());
    return symbols;
}

void InstrumentManager::clear() { m_instruments.clear(); }

} // namespace oceanbook
