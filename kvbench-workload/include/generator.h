#pragma once

#include <cstdint>
#include <random>

#include "types.h"
#include "zipf_distribution.h"

namespace kvbench {

/**
 * @brief Mixes a base seed with a stream id (splitmix64).
 *
 * Used to hand every generator of every worker its own reproducible seed
 * from the single seed of a benchmark run.
 */
uint64_t DeriveSeed(uint64_t base, uint64_t stream);

/**
 * @brief Fills `size` bytes from `engine`, eight bytes per draw.
 *
 * The load phase seeds one engine with the key index and fills the key
 * first, then the value, from it.
 */
void FillBytes(std::mt19937_64& engine, uint8_t* data, uint64_t size);

/**
 * @brief Key bytes of the zero-based key `index`.
 *
 * Byte-identical to the key the load phase writes for the same index.
 */
Bytes KeyBytesForIndex(uint64_t index, uint64_t size);

/**
 * @brief Zipf-distributed sizes over [1, range].
 */
class SizeGenerator {
   public:
    static tl::expected<SizeGenerator, ErrorCode> Create(uint64_t range,
                                                         uint64_t seed);

    // Next sample; an offset the caller adds to its range floor.
    uint64_t GetSize() { return zipf_(engine_); }

   private:
    SizeGenerator(ZipfDistribution zipf, uint64_t seed)
        : zipf_(zipf), engine_(seed) {}

    ZipfDistribution zipf_;
    std::mt19937_64 engine_;
};

/**
 * @brief Key and value payload generator.
 *
 * Keys are picked from a Zipf-skewed index space [1, cardinality] and each
 * index maps to one fixed byte string, which yields a stable hot/cold key
 * population. Values come from the generator's own stream and are never
 * repeated on purpose.
 */
class ByteGenerator {
   public:
    static tl::expected<ByteGenerator, ErrorCode> Create(uint64_t cardinality,
                                                         uint64_t seed);

    /**
     * @brief Draws a key index and returns its bytes
     * @param size Key length in bytes
     *
     * Independent of call order and thread: the bytes only depend on the
     * sampled index.
     */
    Bytes GetKeyBytes(uint64_t size);

    /**
     * @brief Same as GetKeyBytes but also reports the sampled index (1-based)
     */
    Bytes GetKeyBytes(uint64_t size, uint64_t* sampled_index);

    /**
     * @brief Fresh value bytes from the generator stream
     * @param size Value length in bytes
     */
    Bytes GetValueBytes(uint64_t size);

   private:
    ByteGenerator(ZipfDistribution zipf, uint64_t seed)
        : zipf_(zipf), engine_(seed) {}

    ZipfDistribution zipf_;
    std::mt19937_64 engine_;
};

}  // namespace kvbench
