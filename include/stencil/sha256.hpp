#pragma once

#include <stencil/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace stencil {

// Streaming SHA-256 (FIPS 180-4)
class Sha256 {
public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The object must not be fed afterwards.
    Digest finish();

    static std::string to_hex(const Digest& digest);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

std::string sha256_hex(const std::string& data);

// Hex digest of a file's contents
Result<std::string> sha256_file(const std::filesystem::path& path);

// Accepts "sha256:<hex>" or bare 64-character hex; returns lowercase hex
Result<std::string> parse_checksum(const std::string& text);

} // namespace stencil
