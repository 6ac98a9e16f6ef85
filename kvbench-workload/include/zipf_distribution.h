#pragma once

#include <cmath>
#include <cstdint>
#include <random>

#include "types.h"

namespace kvbench {

/**
 * @brief Zipf distribution over the integers [1, n] with exponent s.
 *
 * Samples are drawn by rejection from the inverse of the integral of
 * x^-s, so construction is O(1) and nothing is precomputed per element;
 * this keeps key spaces of any cardinality cheap. Rank 1 is the most
 * frequent value.
 */
class ZipfDistribution {
   public:
    /**
     * @brief Creates a distribution over [1, n]
     * @param n Number of elements, must be at least 1
     * @param s Skew exponent, must be non-negative (0 is uniform)
     * @return The distribution or ErrorCode::INVALID_PARAMS
     */
    static tl::expected<ZipfDistribution, ErrorCode> Create(uint64_t n,
                                                            double s);

    template <typename Engine>
    uint64_t operator()(Engine& engine) const {
        std::uniform_real_distribution<double> uniform(0.0, 1.0);
        while (true) {
            double inv_b = InverseCdf(uniform(engine));
            double x = std::floor(inv_b + 1.0);
            double ratio = std::pow(x, -s_);
            if (x > 1.0) {
                ratio *= std::pow(inv_b, s_);
            }
            if (uniform(engine) < ratio) {
                return static_cast<uint64_t>(x);
            }
        }
    }

    uint64_t n() const { return n_; }
    double s() const { return s_; }

   private:
    ZipfDistribution(uint64_t n, double s);

    double InverseCdf(double p) const;

    uint64_t n_;
    double s_;
    double t_;  // integral of the hat function over [0, n]
    double q_;  // 1 / (1 - s), unused when s == 1
};

}  // namespace kvbench
