#pragma once
// SHA-256 (FIPS 180-4) for content digests and stable record identities.
// Self-contained; incremental via update() or one-shot via hash_hex().
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mdingest {

class SHA256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    static constexpr size_t BLOCK_SIZE = 64;

    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    SHA256() noexcept { reset(); }

    void reset() noexcept;

    void update(const void* data, size_t len) noexcept;
    void update(std::string_view text) noexcept { update(text.data(), text.size()); }

    // Pads and returns the digest; call reset() before reusing the context
    Digest finalize() noexcept;

    static Digest hash(std::string_view text) noexcept {
        SHA256 ctx;
        ctx.update(text);
        return ctx.finalize();
    }

    static std::string hash_hex(std::string_view text) {
        return to_hex(hash(text));
    }

    static std::string to_hex(const Digest& digest);

private:
    uint32_t state_[8]{};
    uint8_t buf_[BLOCK_SIZE]{};
    size_t buf_len_ = 0;
    uint64_t count_ = 0;

    void transform(const uint8_t* block) noexcept;
};

} // namespace mdingest
