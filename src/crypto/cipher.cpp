#include <openssl/err.h>
#include <openssl/evp.h>

#include "crypto/cipher.hpp"
#include "util/log.hpp"

namespace crypto
{

static_assert(constants::KEY_SIZE == 16, "AES-128 and DES-EDE both take a 16-byte key");

namespace
{

class ScopedCipherCtx
{
  public:
    ScopedCipherCtx() : ctx_(EVP_CIPHER_CTX_new()) {}
    ~ScopedCipherCtx() { EVP_CIPHER_CTX_free(ctx_); }

    ScopedCipherCtx(const ScopedCipherCtx &)            = delete;
    ScopedCipherCtx &operator=(const ScopedCipherCtx &) = delete;

    EVP_CIPHER_CTX *get() { return ctx_; }

  private:
    EVP_CIPHER_CTX *ctx_;
};

void log_openssl_error(const char *what)
{
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof buf);
    LOG_ERROR("%s failed: %s", what, buf);
}

// One-shot EVP run; enc = 1 encrypts, 0 decrypts.
bool run_cipher(const EVP_CIPHER    *type,
                int                  enc,
                bool                 padding,
                const std::uint8_t  *key,
                const std::uint8_t  *iv,
                const std::uint8_t  *in,
                std::size_t          in_len,
                std::vector<std::uint8_t> &out)
{
    ScopedCipherCtx ctx;
    if (!ctx.get())
    {
        log_openssl_error("EVP_CIPHER_CTX_new");
        return false;
    }
    if (EVP_CipherInit_ex(ctx.get(), type, nullptr, key, iv, enc) != 1)
    {
        log_openssl_error("EVP_CipherInit_ex");
        return false;
    }
    (void)EVP_CIPHER_CTX_set_padding(ctx.get(), padding ? 1 : 0);

    out.resize(in_len + static_cast<std::size_t>(EVP_CIPHER_block_size(type)));
    int len = 0;
    if (in_len &&
        EVP_CipherUpdate(ctx.get(), out.data(), &len, in, static_cast<int>(in_len)) != 1)
    {
        log_openssl_error("EVP_CipherUpdate");
        return false;
    }
    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.data() + len, &final_len) != 1)
    {
        // bad padding on decrypt lands here
        log_openssl_error("EVP_CipherFinal_ex");
        return false;
    }
    out.resize(static_cast<std::size_t>(len + final_len));
    return true;
}

}  // namespace

bool AesCbcCipher::encrypt(const std::uint8_t               iv[IV_SIZE],
                           const std::vector<std::uint8_t> &plaintext,
                           std::vector<std::uint8_t>       &out)
{
    return run_cipher(EVP_aes_128_cbc(), 1, true, key_.data(), iv, plaintext.data(),
                      plaintext.size(), out);
}

bool AesCbcCipher::decrypt(const std::uint8_t               iv[IV_SIZE],
                           const std::vector<std::uint8_t> &ciphertext,
                           std::vector<std::uint8_t>       &out)
{
    if (ciphertext.empty() || ciphertext.size() % AES_BLOCK_SIZE != 0)
    {
        LOG_ERROR("ciphertext length %zu is not a positive multiple of %zu", ciphertext.size(),
                  AES_BLOCK_SIZE);
        return false;
    }
    return run_cipher(EVP_aes_128_cbc(), 0, true, key_.data(), iv, ciphertext.data(),
                      ciphertext.size(), out);
}

bool DesEdeHeaderCipher::encrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                                       std::uint8_t       out[HEADER_BLOCK_SIZE])
{
    std::vector<std::uint8_t> buf;
    if (!run_cipher(EVP_des_ede_ecb(), 1, false, key_.data(), nullptr, in, HEADER_BLOCK_SIZE,
                    buf) ||
        buf.size() != HEADER_BLOCK_SIZE)
        return false;
    std::copy(buf.begin(), buf.end(), out);
    return true;
}

bool DesEdeHeaderCipher::decrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                                       std::uint8_t       out[HEADER_BLOCK_SIZE])
{
    std::vector<std::uint8_t> buf;
    if (!run_cipher(EVP_des_ede_ecb(), 0, false, key_.data(), nullptr, in, HEADER_BLOCK_SIZE,
                    buf) ||
        buf.size() != HEADER_BLOCK_SIZE)
        return false;
    std::copy(buf.begin(), buf.end(), out);
    return true;
}

}  // namespace crypto
