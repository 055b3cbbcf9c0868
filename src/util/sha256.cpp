#include <stencil/sha256.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>

namespace stencil {

namespace {

constexpr uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

} // namespace

Sha256::Sha256()
    : h_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
         0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19} {}

void Sha256::compress(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) {
        const uint8_t* p = block + i * 4;
        w[i] = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
               (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    }
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<uint32_t, 8> v = h_;
    for (int i = 0; i < 64; ++i) {
        uint32_t s1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
        uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
        uint32_t t1 = v[7] + s1 + choose + kRound[i] + w[i];
        uint32_t s0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
        uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = s0 + majority;

        for (int j = 7; j > 0; --j) v[j] = v[j - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) h_[i] += v[i];
}

void Sha256::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        size_t take = std::min(len, pending_.size() - pending_len_);
        std::memcpy(pending_.data() + pending_len_, data, take);
        pending_len_ += take;
        data += take;
        len -= take;
        if (pending_len_ == pending_.size()) {
            compress(pending_.data());
            pending_len_ = 0;
        }
    }
}

void Sha256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

Sha256::Digest Sha256::finish() {
    uint64_t bits = length_ * 8;

    pending_[pending_len_++] = 0x80;
    if (pending_len_ > 56) {
        std::fill(pending_.begin() + pending_len_, pending_.end(), 0);
        compress(pending_.data());
        pending_len_ = 0;
    }
    std::fill(pending_.begin() + pending_len_, pending_.begin() + 56, 0);
    for (int i = 0; i < 8; ++i) {
        pending_[56 + i] = uint8_t(bits >> (56 - 8 * i));
    }
    compress(pending_.data());
    pending_len_ = 0;

    Digest out;
    for (int i = 0; i < 8; ++i) {
        out[i * 4 + 0] = uint8_t(h_[i] >> 24);
        out[i * 4 + 1] = uint8_t(h_[i] >> 16);
        out[i * 4 + 2] = uint8_t(h_[i] >> 8);
        out[i * 4 + 3] = uint8_t(h_[i]);
    }
    return out;
}

std::string Sha256::to_hex(const Digest& digest) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t b : digest) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
    Sha256 ctx;
    ctx.update(data);
    return Sha256::to_hex(ctx.finish());
}

Result<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return StencilError{StencilError::IO,
            "cannot open file for hashing: " + path.string()};
    }

    Sha256 ctx;
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        if (in.gcount() > 0) {
            ctx.update(reinterpret_cast<const uint8_t*>(buf),
                       static_cast<size_t>(in.gcount()));
        }
    }
    return Result<std::string>::ok(Sha256::to_hex(ctx.finish()));
}

Result<std::string> parse_checksum(const std::string& text) {
    std::string hex = text;
    const std::string prefix = "sha256:";
    if (hex.compare(0, prefix.size(), prefix) == 0) {
        hex = hex.substr(prefix.size());
    } else if (hex.find(':') != std::string::npos) {
        return StencilError{StencilError::Configuration,
            "unsupported checksum algorithm in '" + text + "'",
            "use sha256:<64 hex digits>"};
    }

    if (hex.size() != 64) {
        return StencilError{StencilError::Configuration,
            "checksum must be 64 hex digits, got " + std::to_string(hex.size())};
    }
    for (char& c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return StencilError{StencilError::Configuration,
                "invalid character in checksum '" + text + "'"};
        }
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return Result<std::string>::ok(std::move(hex));
}

} // namespace stencil
