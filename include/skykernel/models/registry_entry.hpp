#pragma once
#include "skykernel/models/ed25519_keypair.hpp"
#include "skykernel/models/skylink.hpp"
#include <cstdint>
#include <vector>
namespace skykernel::models {
struct RegistryEntry {
    PublicKey public_key{};
    Datakey datakey{};
    std::vector<uint8_t> data;
    uint64_t revision = 0;
    Signature signature{};
};
}
