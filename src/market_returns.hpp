#ifndef RETIRECALC_MARKET_RETURNS_HPP
#define RETIRECALC_MARKET_RETURNS_HPP

#include <cstdint>
#include <random>
#include <vector>

namespace retirecalc {

// Seeded source of annual capital-growth rates for stochastic projections.
// Draws standard normals with the Box-Muller transform over two uniform
// samples; a uniform of exactly zero is redrawn so the logarithm stays finite.
class ReturnGenerator {
public:
    explicit ReturnGenerator(uint64_t seed);

    // One standard normal variate
    double standard_normal();

    // mean + volatility * Z
    double sample_growth(double mean, double volatility);

    // A path of annual growth rates, one draw per year
    std::vector<double> sample_path(size_t years, double mean, double volatility);

private:
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_;
    bool has_spare_;
    double spare_;

    double next_uniform_nonzero();
};

// Derive independent per-run seeds from one master seed
std::vector<uint64_t> derive_run_seeds(uint64_t master_seed, size_t count);

} // namespace retirecalc

#endif // RETIRECALC_MARKET_RETURNS_HPP
