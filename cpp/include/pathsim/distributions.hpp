/**
 * @file distributions.hpp
 * @brief Inter-arrival and service time distributions
 */

#ifndef PATHSIM_DISTRIBUTIONS_HPP
#define PATHSIM_DISTRIBUTIONS_HPP

#include <random>
#include <string>

namespace pathsim {

/// Random source owned by a single simulation run
using Rng = std::mt19937;

/**
 * @brief Closed set of duration distributions (times in days)
 *
 * - EXPONENTIAL: mean 1/rate
 * - SHIFTED_EXPONENTIAL: shift + Exponential(rate), a floor on the duration
 *   plus memoryless variability beyond it
 */
class Distribution {
public:
    enum class Kind {
        EXPONENTIAL,
        SHIFTED_EXPONENTIAL
    };

    /**
     * @brief Build an Exponential(rate)
     * @throws InvalidParameter if rate is not a positive finite number
     */
    static Distribution exponential(double rate);

    /**
     * @brief Build shift + Exponential(rate)
     * @throws InvalidParameter on a non-positive rate or a negative shift
     */
    static Distribution shifted_exponential(double rate, double shift);

    double sample(Rng& rng) const;

    Kind kind() const { return kind_; }
    double rate() const { return rate_; }
    double shift() const { return shift_; }
    double mean() const { return shift_ + 1.0 / rate_; }

    std::string describe() const;

private:
    Distribution(Kind kind, double rate, double shift);

    Kind kind_;
    double rate_;
    double shift_;
};

} // namespace pathsim

#endif // PATHSIM_DISTRIBUTIONS_HPP
