#include "crypto/aes.hpp"
#include "crypto/error.hpp"
#include "crypto/random.hpp"
#include <openssl/evp.h>

namespace Ballot::Crypto::Aes {

namespace {
    enum class Direction : int {
        Open = 0,
        Seal = 1,
    };

    // 单次 CBC 运算，结果追加到 out 尾部
    auto run_cbc(evp_cipher_ctx_st* ctx, Direction dir, const AesKey& key, BytesSpan iv, BytesSpan input, Bytes& out)
        -> std::expected<void, std::error_code>
    {
        if (ctx == nullptr)
            return std::unexpected(Error::OpenSSLError);
        if (1 != EVP_CipherInit_ex(ctx, EVP_aes_256_cbc(), nullptr, u8ptr(key.data()), u8ptr(iv), static_cast<int>(dir)))
            return std::unexpected(Error::OpenSSLError);

        const Error failure = dir == Direction::Seal ? Error::OpenSSLError : Error::DecryptionFailed;
        const size_t start = out.size();
        out.resize(start + input.size() + BLOCK_SIZE);

        int written = 0;
        int tail = 0;
        if (1 != EVP_CipherUpdate(ctx, u8ptr(out.data() + start), &written, u8ptr(input), static_cast<int>(input.size())))
            return std::unexpected(failure);
        if (1 != EVP_CipherFinal_ex(ctx, u8ptr(out.data() + start + written), &tail))
            return std::unexpected(failure);

        out.resize(start + static_cast<size_t>(written + tail));
        return {};
    }
} // namespace

void Context::Free::operator()(evp_cipher_ctx_st* ctx) const
{
    EVP_CIPHER_CTX_free(ctx);
}

Context::Context()
    : ptr_(EVP_CIPHER_CTX_new())
{
}

auto seal(Context& ctx, RandomSource& rng, const AesKey& key, BytesSpan plaintext)
    -> std::expected<Bytes, std::error_code>
{
    Bytes box(IV_SIZE);
    if (auto filled = rng.fill(box); !filled)
        return std::unexpected(filled.error());

    box.reserve(IV_SIZE + plaintext.size() + BLOCK_SIZE);
    const Bytes iv(box.begin(), box.end());
    if (auto r = run_cbc(ctx.get(), Direction::Seal, key, iv, plaintext, box); !r)
        return std::unexpected(r.error());
    return box;
}

auto open(Context& ctx, const AesKey& key, BytesSpan sealed) -> std::expected<Bytes, std::error_code>
{
    if (sealed.size() < IV_SIZE + BLOCK_SIZE || (sealed.size() - IV_SIZE) % BLOCK_SIZE != 0)
        return std::unexpected(Error::DecryptionFailed);

    Bytes plaintext;
    if (auto r = run_cbc(ctx.get(), Direction::Open, key, sealed.first(IV_SIZE), sealed.subspan(IV_SIZE), plaintext); !r)
        return std::unexpected(r.error());
    return plaintext;
}

} // namespace Ballot::Crypto::Aes
