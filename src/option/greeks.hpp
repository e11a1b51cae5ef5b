// SPDX-License-Identifier: MIT
#pragma once

namespace condor {

/// First-order sensitivities of a single option, per share.
///
/// Raw Black-Scholes signs: position direction is applied by the caller
/// when legs are aggregated. Theta is per calendar day, vega per one
/// volatility point.
struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;

    Greeks& operator+=(const Greeks& other) {
        delta += other.delta;
        gamma += other.gamma;
        theta += other.theta;
        vega += other.vega;
        return *this;
    }

    friend Greeks operator+(Greeks lhs, const Greeks& rhs) {
        lhs += rhs;
        return lhs;
    }

    friend Greeks operator*(Greeks g, double scale) {
        g.delta *= scale;
        g.gamma *= scale;
        g.theta *= scale;
        g.vega *= scale;
        return g;
    }
};

}  // namespace condor
