#ifndef PMSIM_RANDOM_STREAM_HPP
#define PMSIM_RANDOM_STREAM_HPP

#include <gsl/gsl_rng.h>
#include <cstdint>

namespace pmsim {

/**
 * @class RandomStream
 * @brief Owns one GSL Mersenne Twister generator.
 *
 * Every province and the mobility step draw from their own stream, so the
 * order in which provinces are evaluated does not change the trajectory.
 * Move-only.
 */
class RandomStream {
public:
    /**
     * @brief Creates a generator seeded with `seed`.
     * @throws SimulationException if GSL cannot allocate the generator.
     */
    explicit RandomStream(unsigned long seed);

    /**
     * @brief Creates the sub-stream `stream_id` of a run seed.
     *
     * Sub-stream seeds are derived with a splitmix64 mix of (seed, stream_id),
     * so neighbouring ids yield uncorrelated generators.
     */
    static RandomStream subStream(unsigned long seed, std::uint64_t stream_id);

    static unsigned long deriveSeed(unsigned long seed, std::uint64_t stream_id);

    ~RandomStream();

    RandomStream(RandomStream&& other) noexcept;
    RandomStream& operator=(RandomStream&& other) noexcept;

    RandomStream(const RandomStream&) = delete;
    RandomStream& operator=(const RandomStream&) = delete;

    /**
     * @brief Draws from Binomial(n, p).
     *
     * `p` is clamped to [0,1]. Returns 0 without consuming randomness when
     * n == 0 or p == 0, and n when p == 1. Counts above UINT_MAX are drawn
     * in chunks.
     */
    long binomial(long n, double p);

    unsigned long getSeed() const { return seed_; }

private:
    gsl_rng* rng_;
    unsigned long seed_;
};

} // namespace pmsim

#endif // PMSIM_RANDOM_STREAM_HPP
