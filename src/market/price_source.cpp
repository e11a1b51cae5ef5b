// SPDX-License-Identifier: MIT
#include "condor/market/price_source.hpp"
#include <cmath>

namespace condor {

std::expected<double, std::string> StaticPriceSource::current_price(const std::string& symbol) const {
    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
        return std::unexpected("No price for symbol: " + symbol);
    }
    if (!(it->second > 0.0) || !std::isfinite(it->second)) {
        return std::unexpected("Invalid price for symbol: " + symbol);
    }
    return it->second;
}

}  // namespace condor
