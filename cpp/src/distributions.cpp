/**
 * @file distributions.cpp
 * @brief Exponential and shifted exponential sampling
 */

#include "pathsim/distributions.hpp"
#include "pathsim/errors.hpp"

#include <cmath>
#include <sstream>

namespace pathsim {

Distribution::Distribution(Kind kind, double rate, double shift)
    : kind_(kind)
    , rate_(rate)
    , shift_(shift)
{
    if (!std::isfinite(rate_) || rate_ <= 0.0) {
        std::ostringstream oss;
        oss << "distribution rate must be positive and finite, got " << rate_;
        throw InvalidParameter(oss.str());
    }
    if (!std::isfinite(shift_) || shift_ < 0.0) {
        std::ostringstream oss;
        oss << "distribution shift must be non-negative and finite, got " << shift_;
        throw InvalidParameter(oss.str());
    }
}

Distribution Distribution::exponential(double rate) {
    return Distribution(Kind::EXPONENTIAL, rate, 0.0);
}

Distribution Distribution::shifted_exponential(double rate, double shift) {
    return Distribution(Kind::SHIFTED_EXPONENTIAL, rate, shift);
}

double Distribution::sample(Rng& rng) const {
    std::exponential_distribution<double> dist(rate_);
    switch (kind_) {
        case Kind::EXPONENTIAL:
            return dist(rng);
        case Kind::SHIFTED_EXPONENTIAL:
            return shift_ + dist(rng);
    }
    return dist(rng);
}

std::string Distribution::describe() const {
    std::ostringstream oss;
    switch (kind_) {
        case Kind::EXPONENTIAL:
            oss << "Exponential(rate=" << rate_ << ")";
            break;
        case Kind::SHIFTED_EXPONENTIAL:
            oss << "ShiftedExponential(rate=" << rate_ << ", shift=" << shift_ << ")";
            break;
    }
    return oss.str();
}

} // namespace pathsim
