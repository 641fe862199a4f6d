#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace kvsession
{

// Supplier of uniformly distributed random bits for session ids.
// Implementations are shared by every request and must be thread-safe.
class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        // Fill and return `count` random bytes. Throws if no randomness is available.
        virtual std::vector<std::uint8_t> random_bytes(std::size_t count) = 0;

        // Big-endian integer of exactly `bits` random bits (high bits of the
        // first byte masked off when bits is not a multiple of 8).
        std::vector<std::uint8_t> random_bits(unsigned bits);
    };

// OpenSSL CSPRNG (RAND_bytes). The default source.
class SystemRandomSource : public RandomSource
    {
    public:
        std::vector<std::uint8_t> random_bytes(std::size_t count) override;
    };

// Deterministic mt19937_64 stream. Not suitable for production session ids.
class SeededRandomSource : public RandomSource
    {
    public:
        explicit SeededRandomSource(std::uint64_t seed);

        std::vector<std::uint8_t> random_bytes(std::size_t count) override;

    private:
        std::mt19937_64 gen_;
        std::mutex mtx_;
    };

using RandomSourcePtr = std::shared_ptr<RandomSource>;

} // namespace kvsession
