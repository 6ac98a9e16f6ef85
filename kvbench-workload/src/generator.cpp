#include "generator.h"

#include <glog/logging.h>

#include <cstring>

namespace kvbench {

uint64_t DeriveSeed(uint64_t base, uint64_t stream) {
    uint64_t z = base + (stream + 1) * 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

void FillBytes(std::mt19937_64& engine, uint8_t* data, uint64_t size) {
    uint64_t offset = 0;
    while (offset + sizeof(uint64_t) <= size) {
        uint64_t word = engine();
        std::memcpy(data + offset, &word, sizeof(word));
        offset += sizeof(word);
    }
    if (offset < size) {
        uint64_t word = engine();
        std::memcpy(data + offset, &word, size - offset);
    }
}

Bytes KeyBytesForIndex(uint64_t index, uint64_t size) {
    Bytes bytes(size);
    std::mt19937_64 engine(index);
    FillBytes(engine, bytes.data(), size);
    return bytes;
}

tl::expected<SizeGenerator, ErrorCode> SizeGenerator::Create(uint64_t range,
                                                             uint64_t seed) {
    auto zipf = ZipfDistribution::Create(range, DEFAULT_ZIPF_EXPONENT);
    if (!zipf) {
        LOG(ERROR) << "Failed to create size generator, range=" << range;
        return tl::make_unexpected(zipf.error());
    }
    return SizeGenerator(zipf.value(), seed);
}

tl::expected<ByteGenerator, ErrorCode> ByteGenerator::Create(
    uint64_t cardinality, uint64_t seed) {
    auto zipf = ZipfDistribution::Create(cardinality, DEFAULT_ZIPF_EXPONENT);
    if (!zipf) {
        LOG(ERROR) << "Failed to create byte generator, cardinality="
                   << cardinality;
        return tl::make_unexpected(zipf.error());
    }
    return ByteGenerator(zipf.value(), seed);
}

Bytes ByteGenerator::GetKeyBytes(uint64_t size) {
    uint64_t unused;
    return GetKeyBytes(size, &unused);
}

Bytes ByteGenerator::GetKeyBytes(uint64_t size, uint64_t* sampled_index) {
    uint64_t idx = zipf_(engine_);
    *sampled_index = idx;
    // Indices are 1-based, the loaded key universe is 0-based.
    return KeyBytesForIndex(idx - 1, size);
}

Bytes ByteGenerator::GetValueBytes(uint64_t size) {
    Bytes bytes(size);
    FillBytes(engine_, bytes.data(), size);
    return bytes;
}

}  // namespace kvbench
