#include "market_returns.hpp"
#include <cmath>

namespace retirecalc {

namespace {
constexpr double TWO_PI = 6.283185307179586476925286766559;
} // anonymous namespace

ReturnGenerator::ReturnGenerator(uint64_t seed)
    : rng_(seed), uniform_(0.0, 1.0), has_spare_(false), spare_(0.0) {}

double ReturnGenerator::next_uniform_nonzero() {
    double u = uniform_(rng_);
    while (u == 0.0) {
        u = uniform_(rng_);
    }
    return u;
}

double ReturnGenerator::standard_normal() {
    if (has_spare_) {
        has_spare_ = false;
        return spare_;
    }

    // Box-Muller: two uniforms in (0, 1) -> two independent standard normals
    const double u1 = next_uniform_nonzero();
    const double u2 = next_uniform_nonzero();
    const double radius = std::sqrt(-2.0 * std::log(u1));
    const double angle = TWO_PI * u2;

    spare_ = radius * std::sin(angle);
    has_spare_ = true;
    return radius * std::cos(angle);
}

double ReturnGenerator::sample_growth(double mean, double volatility) {
    if (volatility == 0.0) {
        return mean;
    }
    return mean + volatility * standard_normal();
}

std::vector<double> ReturnGenerator::sample_path(size_t years, double mean, double volatility) {
    std::vector<double> path;
    path.reserve(years);
    for (size_t i = 0; i < years; ++i) {
        path.push_back(sample_growth(mean, volatility));
    }
    return path;
}

std::vector<uint64_t> derive_run_seeds(uint64_t master_seed, size_t count) {
    std::mt19937_64 master(master_seed);
    std::vector<uint64_t> seeds;
    seeds.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        seeds.push_back(master());
    }
    return seeds;
}

} // namespace retirecalc
