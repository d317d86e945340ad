#pragma once
#include "skykernel/core/result.hpp"
#include "skykernel/core/failures.hpp"
#include "skykernel/crypto/hashing.hpp"
#include <span>
namespace skykernel::skylink {
class Merkle {
public:
    /**
     * @brief BLAKE2b Merkle root of a full sector
     *
     * The sector must be exactly 1 << 22 bytes. Leaves are 64-byte segments
     * hashed as blake2b(0x00 ++ leaf), inner nodes as
     * blake2b(0x01 ++ left ++ right).
     */
    static Result<crypto::Blake2bDigest, KernelFailure> BlakeMerkleRoot(std::span<const uint8_t> sector);
private:
    Merkle() = delete;
};
}
