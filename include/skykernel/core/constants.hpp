#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace skykernel {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t ED_25519_ENTROPY_SIZE = 32;
    static constexpr size_t SHA_512_HASH_SIZE = 64;
    static constexpr size_t BLAKE_2B_HASH_SIZE = 32;
    static constexpr size_t U64_ENCODED_SIZE = 8;
};
struct SeedConstants {
    static constexpr size_t SEED_BYTES = 16;
    static constexpr size_t SEED_ENTROPY_WORDS = 13;
    static constexpr size_t SEED_CHECKSUM_WORDS = 2;
    static constexpr size_t SEED_PHRASE_WORDS = SEED_ENTROPY_WORDS + SEED_CHECKSUM_WORDS;
    static constexpr size_t DICTIONARY_SIZE = 1024;
    static constexpr size_t DICTIONARY_UNIQUE_PREFIX = 3;
    static constexpr unsigned ENTROPY_WORD_BITS = 10;
    static constexpr unsigned FINAL_ENTROPY_WORD_BITS = 8;
    static constexpr size_t GENERATOR_RANDOM_BYTES = 32;
    static constexpr std::string_view CHILD_SEED_SEPARATOR = " - ";
    // MySky compatibility salt, must never change.
    static constexpr std::string_view LEGACY_ROOT_SALT = "root discoverable key";
};
struct RegistryConstants {
    static constexpr size_t DATAKEY_SIZE = 32;
    static constexpr size_t ENTRY_ID_SIZE = 32;
    static constexpr size_t MAX_DATA_SIZE = 86;
    static constexpr size_t MAX_KEYPAIR_TAG_SIZE = 255;
    static constexpr size_t SPECIFIER_SIZE = 16;
    static constexpr std::string_view ED_25519_SPECIFIER = "ed25519";
    static constexpr std::string_view ENDPOINT = "/skynet/registry";
    static constexpr std::string_view PUBKEY_PREFIX = "ed25519%3A";
    static constexpr std::string_view ALGORITHM = "ed25519";
};
struct SkylinkConstants {
    static constexpr size_t SKYLINK_SIZE = 34;
    static constexpr size_t BITFIELD_SIZE = 2;
    static constexpr size_t ROOT_OFFSET = 2;
    static constexpr size_t SKYLINK_TEXT_SIZE = 46;
    static constexpr uint64_t SECTOR_SIZE = 1ULL << 22;
    static constexpr size_t SEGMENT_SIZE = 64;
    static constexpr uint64_t FETCH_SIZE_STEP = 4096;
    static constexpr uint64_t MODE_ZERO_LIMIT = 1ULL << 15;
    static constexpr unsigned MAX_MODE = 7;
    static constexpr uint8_t RESOLVER_BITFIELD_BYTE = 1;
    static constexpr uint8_t LEAF_HASH_PREFIX = 0x00;
    static constexpr uint8_t NODE_HASH_PREFIX = 0x01;
};
struct SkyfileConstants {
    static constexpr size_t LAYOUT_SIZE = 99;
    static constexpr uint8_t LAYOUT_VERSION = 1;
    static constexpr size_t CIPHER_TYPE_SIZE = 8;
    static constexpr size_t LAYOUT_KEY_DATA_SIZE = 64;
    static constexpr size_t UPLOAD_HEADER_SIZE = 92;
    static constexpr uint64_t MAX_UPLOAD_SIZE = 4 * 1000 * 1000;
    static constexpr std::string_view HEADER_METADATA = "Skyfile Backup\n";
    static constexpr std::string_view HEADER_VERSION = "v1.5.5\n";
    static constexpr std::string_view RESTORE_ENDPOINT = "/skynet/restore";
    static constexpr std::string_view BASE_SECTOR_ENDPOINT = "/skynet/trustless/basesector/";
    static constexpr std::string_view PROOF_HEADER = "skynet-proof";
};
struct StorageConstants {
    static constexpr std::string_view USER_SEED_KEY = "v1-seed";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view SEED_WRONG_LENGTH = "seed has the wrong length";
    static constexpr std::string_view PUBKEY_WRONG_LENGTH = "pubkey is invalid, length is wrong";
    static constexpr std::string_view DATAKEY_WRONG_LENGTH = "datakey is not a valid hash, length is wrong";
    static constexpr std::string_view REGISTRY_DATA_TOO_LARGE = "registry data must be at most 86 bytes";
    static constexpr std::string_view ALL_HOSTS_FAILED = "query failed because all portals have been tried";
    static constexpr std::string_view NO_USER_SEED = "no user seed in local storage";
};
}
