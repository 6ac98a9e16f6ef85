#include "zipf_distribution.h"

#include <glog/logging.h>

namespace kvbench {

tl::expected<ZipfDistribution, ErrorCode> ZipfDistribution::Create(uint64_t n,
                                                                   double s) {
    if (n < 1) {
        LOG(ERROR) << "Zipf domain must contain at least one element, n=" << n;
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    if (!(s >= 0.0)) {
        LOG(ERROR) << "Zipf exponent must be non-negative, s=" << s;
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    return ZipfDistribution(n, s);
}

ZipfDistribution::ZipfDistribution(uint64_t n, double s) : n_(n), s_(s) {
    double nf = static_cast<double>(n);
    if (s != 1.0) {
        q_ = 1.0 / (1.0 - s);
        t_ = (std::pow(nf, 1.0 - s) - s) * q_;
    } else {
        q_ = 0.0;
        t_ = 1.0 + std::log(nf);
    }
}

double ZipfDistribution::InverseCdf(double p) const {
    double pt = p * t_;
    if (pt <= 1.0) {
        return pt;
    }
    if (s_ != 1.0) {
        return std::pow(pt * (1.0 - s_) + s_, q_);
    }
    return std::exp(pt - 1.0);
}

}  // namespace kvbench
