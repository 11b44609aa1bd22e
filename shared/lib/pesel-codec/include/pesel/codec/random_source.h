/**
 * @file random_source.h
 * @brief Randomness provider interface for PESEL generation
 *
 * Decouples generate() from a concrete entropy source so tests can feed
 * a fixed sequence and assert exact output strings.
 */

#pragma once

namespace pesel::codec {

/**
 * @brief Source of uniformly distributed small integers
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Draw a uniformly distributed integer
     * @param bound Exclusive upper bound, 1-256
     * @return Value in [0, bound)
     */
    virtual int uniform(int bound) = 0;
};

/**
 * @brief IRandomSource backed by OpenSSL RAND_bytes
 *
 * Uses rejection sampling so every value in [0, bound) is equally likely.
 * Holds no state; one instance may be shared freely.
 */
class OpenSslRandomSource : public IRandomSource {
public:
    /**
     * @throws std::invalid_argument if bound is outside 1-256
     * @throws pesel::common::RandomSourceException if RAND_bytes fails
     */
    int uniform(int bound) override;
};

} // namespace pesel::codec
