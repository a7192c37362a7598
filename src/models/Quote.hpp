#ifndef QUOTE_HPP
#define QUOTE_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// --- Last trade snapshot for one symbol ---
class Quote {
public:
    std::string symbol;
    double price = 0.0;
    std::uint64_t volume = 0;
    // Increases with every fetch from the feed; tells reloaded quotes apart.
    std::uint64_t sequence = 0;

    std::string to_string() const {
        std::ostringstream oss;
        oss << symbol << " @ " << std::fixed << std::setprecision(2) << price
            << " vol " << volume << " (seq " << sequence << ")";
        return oss.str();
    }
};

inline void to_json(json& j, const Quote& quote) {
    j = json{
        {"symbol", quote.symbol},
        {"price", quote.price},
        {"volume", quote.volume},
        {"sequence", quote.sequence}
    };
}

#endif // QUOTE_HPP
