#include "skykernel/skylink/merkle.hpp"
#include <fmt/core.h>
#include <array>
#include <vector>

namespace skykernel::skylink {
    using crypto::Blake2bDigest;
    using crypto::Hashing;

    Result<Blake2bDigest, KernelFailure> Merkle::BlakeMerkleRoot(const std::span<const uint8_t> sector) {
        if (sector.size() != SkylinkConstants::SECTOR_SIZE) {
            return Result<Blake2bDigest, KernelFailure>::Err(
                KernelFailure::InvalidInput(fmt::format(
                    "sector must be {} bytes, got {}", SkylinkConstants::SECTOR_SIZE, sector.size())));
        }

        constexpr std::array<uint8_t, 1> leaf_prefix = {SkylinkConstants::LEAF_HASH_PREFIX};
        constexpr std::array<uint8_t, 1> node_prefix = {SkylinkConstants::NODE_HASH_PREFIX};

        std::vector<Blake2bDigest> level;
        level.reserve(sector.size() / SkylinkConstants::SEGMENT_SIZE);
        for (size_t offset = 0; offset < sector.size(); offset += SkylinkConstants::SEGMENT_SIZE) {
            level.push_back(Hashing::Blake2b({
                leaf_prefix,
                sector.subspan(offset, SkylinkConstants::SEGMENT_SIZE)
            }));
        }

        // Leaf count is a power of two so every level pairs up evenly.
        while (level.size() > 1) {
            for (size_t i = 0; i < level.size() / 2; ++i) {
                level[i] = Hashing::Blake2b({node_prefix, level[2 * i], level[2 * i + 1]});
            }
            level.resize(level.size() / 2);
        }
        return Result<Blake2bDigest, KernelFailure>::Ok(level.front());
    }
}
