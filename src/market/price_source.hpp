// SPDX-License-Identifier: MIT
/**
 * @file price_source.hpp
 * @brief Contract for the collaborator that supplies underlying prices
 *
 * The analytics never fetch market data themselves. A caller that wants
 * to analyze a symbol without quoting a price resolves it through a type
 * satisfying PriceSource and passes the number in.
 */

#pragma once

#include <concepts>
#include <expected>
#include <map>
#include <string>
#include <utility>

namespace condor {

/**
 * @brief Concept for underlying price providers
 *
 * current_price(symbol) returns the last price or an error message.
 */
template <typename P>
concept PriceSource = requires(const P& source, const std::string& symbol) {
    { source.current_price(symbol) } -> std::same_as<std::expected<double, std::string>>;
};

/**
 * @brief Fixed symbol -> price table
 *
 * Useful for tests and offline runs. Unknown symbols and non-positive
 * prices are reported as errors.
 */
class StaticPriceSource {
public:
    StaticPriceSource() = default;
    explicit StaticPriceSource(std::map<std::string, double> prices)
        : prices_(std::move(prices)) {}

    /// Add or replace the price of a symbol
    void set_price(const std::string& symbol, double price) { prices_[symbol] = price; }

    std::expected<double, std::string> current_price(const std::string& symbol) const;

private:
    std::map<std::string, double> prices_;
};

static_assert(PriceSource<StaticPriceSource>);

}  // namespace condor
