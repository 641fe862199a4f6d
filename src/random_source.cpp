#include "kvsession/random_source.hpp"
#include <climits>
#include <stdexcept>
#include <string>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace kvsession
{

std::vector<std::uint8_t> RandomSource::random_bits(unsigned bits)
    {
    std::size_t count = (bits + 7) / 8;
    std::vector<std::uint8_t> bytes = random_bytes(count);
    if (bytes.size() != count)
        {
        throw std::runtime_error("random source returned " + std::to_string(bytes.size()) +
                                 " bytes, expected " + std::to_string(count));
        }

    unsigned spare = bits % 8;
    if (spare != 0)
        {
        bytes[0] &= static_cast<std::uint8_t>((1u << spare) - 1);
        }
    return bytes;
    }

std::vector<std::uint8_t> SystemRandomSource::random_bytes(std::size_t count)
    {
    std::vector<std::uint8_t> bytes(count);
    if (count == 0)
        {
        return bytes;
        }
    if (count > static_cast<std::size_t>(INT_MAX))
        {
        throw std::runtime_error("random request too large");
        }

    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1)
        {
        char err[256];
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
        }
    return bytes;
    }

SeededRandomSource::SeededRandomSource(std::uint64_t seed)
    : gen_(seed)
    {}

std::vector<std::uint8_t> SeededRandomSource::random_bytes(std::size_t count)
    {
    std::vector<std::uint8_t> bytes(count);
    std::lock_guard<std::mutex> lock(mtx_);
    std::uint64_t word = 0;
    for (std::size_t i = 0; i < count; ++i)
        {
        if (i % 8 == 0)
            {
            word = gen_();
            }
        bytes[i] = static_cast<std::uint8_t>(word & 0xFF);
        word >>= 8;
        }
    return bytes;
    }

} // namespace kvsession
