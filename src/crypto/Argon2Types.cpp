#include "pepperhash/crypto/Argon2Types.hpp"

#include <limits>
#include <stdexcept>

namespace pepperhash::crypto
{

void requireArgon2InputsSafe(const Argon2Params& params, std::size_t passwordBytes, std::size_t saltBytes,
                             std::size_t outBytes)
{
    if (params.timeCost == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("argon2Raw: invalid Argon2 parameters");
    }
    if (params.timeCost > g_kArgon2TimeCostCap || params.parallelism > g_kArgon2ParallelismCap ||
        params.memoryKiB > g_kArgon2MemoryKiBCap)
    {
        throw std::invalid_argument("argon2Raw: unsafe Argon2 parameters");
    }
    if (const std::uint32_t minMemoryKiB{ params.parallelism * g_kArgon2MinMemoryKiBPerLane };
        params.memoryKiB < minMemoryKiB)
    {
        throw std::invalid_argument("argon2Raw: memory cost too small for parallelism");
    }

    if (saltBytes < g_kArgon2MinSaltBytes || saltBytes > g_kArgon2MaxSaltBytes)
    {
        throw std::invalid_argument("argon2Raw: invalid salt size");
    }
    if (outBytes < g_kArgon2MinOutputBytes || outBytes > g_kArgon2MaxOutputBytes)
    {
        throw std::invalid_argument("argon2Raw: invalid output size");
    }
    if (passwordBytes > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("argon2Raw: password too large");
    }
}

} // namespace pepperhash::crypto
