#include "pmsim/model/RandomStream.hpp"
#include "pmsim/exceptions/Exceptions.hpp"
#include <gsl/gsl_randist.h>
#include <algorithm>
#include <climits>
#include <utility>

namespace pmsim {

RandomStream::RandomStream(unsigned long seed)
    : rng_(gsl_rng_alloc(gsl_rng_mt19937)), seed_(seed) {
    if (!rng_) {
        PMSIM_THROW_SIMULATION_ERROR("RandomStream", "Failed to allocate GSL random number generator.");
    }
    gsl_rng_set(rng_, seed_);
}

RandomStream RandomStream::subStream(unsigned long seed, std::uint64_t stream_id) {
    return RandomStream(deriveSeed(seed, stream_id));
}

unsigned long RandomStream::deriveSeed(unsigned long seed, std::uint64_t stream_id) {
    std::uint64_t z = static_cast<std::uint64_t>(seed) + 0x9E3779B97F4A7C15ULL * (stream_id + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    z = z ^ (z >> 31);
    // mt19937 only uses the low 32 bits of the seed.
    return static_cast<unsigned long>(z & 0xFFFFFFFFULL);
}

RandomStream::~RandomStream() {
    if (rng_) gsl_rng_free(rng_);
}

RandomStream::RandomStream(RandomStream&& other) noexcept
    : rng_(other.rng_), seed_(other.seed_) {
    other.rng_ = nullptr;
}

RandomStream& RandomStream::operator=(RandomStream&& other) noexcept {
    if (this != &other) {
        if (rng_) gsl_rng_free(rng_);
        rng_ = other.rng_;
        seed_ = other.seed_;
        other.rng_ = nullptr;
    }
    return *this;
}

long RandomStream::binomial(long n, double p) {
    if (n <= 0 || p <= 0.0) return 0;
    if (p >= 1.0) return n;
    // gsl_ran_binomial takes an unsigned int count; larger counts are drawn
    // as a sum of binomials over chunks.
    long drawn = 0;
    while (n > 0) {
        const long chunk = std::min(n, static_cast<long>(UINT_MAX));
        drawn += static_cast<long>(gsl_ran_binomial(rng_, p, static_cast<unsigned int>(chunk)));
        n -= chunk;
    }
    return drawn;
}

} // namespace pmsim
