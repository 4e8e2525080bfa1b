#include "catalyst.hpp"
#include "util.hpp"

namespace {

struct CatalystKeywords {
    std::string category;
    std::vector<std::string> keywords;
};

// First matching category wins, so more specific phrases come first
const std::vector<CatalystKeywords>& keyword_table() {
    static const std::vector<CatalystKeywords> table = {
        {"earnings", {"earnings", "eps", "revenue", "quarterly", "annual report", "guidance", "beat", "miss"}},
        {"fda_approval", {"fda", "approval", "drug", "clinical trial", "phase", "therapeutic"}},
        {"government_contract", {"government", "contract", "dod", "pentagon", "defense", "federal", "military"}},
        {"merger_acquisition", {"merger", "acquisition", "buyout", "takeover", "m&a", "consolidation"}},
        {"product_launch", {"launch", "product", "release", "unveil", "announcement", "new product"}},
        {"analyst_upgrade", {"upgrade", "buy rating", "outperform", "price target raised"}},
        {"analyst_downgrade", {"downgrade", "sell rating", "underperform", "price target lowered"}},
        {"insider_buying", {"insider buying", "insider purchase", "ceo bought", "director bought"}},
        {"insider_selling", {"insider selling", "insider sale", "ceo sold", "director sold"}},
        {"technical_breakout", {"breakout", "resistance", "support", "technical", "chart pattern", "golden cross"}},
        {"momentum_surge", {"momentum", "surge", "spike", "volume spike", "unusual volume", "flow"}},
        {"sector_rotation", {"sector", "rotation", "industry trend", "sector momentum"}},
        {"macro_event", {"fed", "fomc", "interest rate", "inflation", "cpi", "jobs report", "gdp"}},
        {"ai_news", {"ai", "artificial intelligence", "machine learning", "nvidia", "gpu", "data center"}},
        {"quantum_news", {"quantum", "qubit", "ionq", "rigetti", "quantum computing"}},
        {"crypto_news", {"crypto", "bitcoin", "ethereum", "blockchain", "defi", "nft"}},
    };
    return table;
}

} // namespace

const std::vector<std::string>& catalyst_categories() {
    static const std::vector<std::string> categories = [] {
        std::vector<std::string> out;
        for (const auto& entry : keyword_table()) {
            out.push_back(entry.category);
        }
        out.push_back("other");
        return out;
    }();
    return categories;
}

std::string categorize_catalyst(const std::string& catalyst_text) {
    std::string text = util::to_lower(util::trim(catalyst_text));
    if (text.empty()) {
        return "other";
    }

    for (const auto& category : catalyst_categories()) {
        if (text == category) {
            return category;
        }
    }

    for (const auto& entry : keyword_table()) {
        for (const auto& keyword : entry.keywords) {
            if (util::contains(text, keyword)) {
                return entry.category;
            }
        }
    }
    return "other";
}
