#include "crypto/random.hpp"
#include "crypto/error.hpp"
#include "crypto/threshold/utils.hpp"
#include <algorithm>
#include <array>
#include <openssl/rand.h>

namespace Ballot::Crypto {

auto SystemRandom::fill(std::span<Byte> out) -> std::expected<void, std::error_code>
{
    if (out.empty()) {
        return {};
    }
    if (RAND_bytes(u8ptr(out.data()), static_cast<int>(out.size())) != 1) {
        return std::unexpected(Error::OpenSSLError);
    }
    return {};
}

SeededRandom::SeededRandom(BytesSpan seed)
    : seed_(seed.begin(), seed.end())
{
}

SeededRandom::SeededRandom(uint64_t seed)
    : seed_(sizeof(seed))
{
    for (size_t i = 0; i < sizeof(seed); ++i) {
        seed_[i] = static_cast<Byte>(seed >> (8 * (7 - i)));
    }
}

auto SeededRandom::fill(std::span<Byte> out) -> std::expected<void, std::error_code>
{
    size_t written = 0;
    while (written < out.size()) {
        if (block_used_ == block_.size()) {
            std::array<Byte, 8> counter_bytes {};
            for (size_t i = 0; i < counter_bytes.size(); ++i) {
                counter_bytes[i] = static_cast<Byte>(counter_ >> (8 * (7 - i)));
            }
            auto block = Utils::sha256({ seed_, counter_bytes });
            if (!block) {
                return std::unexpected(block.error());
            }
            block_ = *block;
            block_used_ = 0;
            ++counter_;
        }
        const size_t n = std::min(out.size() - written, block_.size() - block_used_);
        std::copy_n(block_.begin() + block_used_, n, out.begin() + written);
        block_used_ += n;
        written += n;
    }
    return {};
}

} // namespace Ballot::Crypto
