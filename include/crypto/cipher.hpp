#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "crypto/key.hpp"

namespace crypto
{

constexpr std::size_t AES_BLOCK_SIZE    = 16;
constexpr std::size_t IV_SIZE           = 16;
constexpr std::size_t HEADER_BLOCK_SIZE = 8;

// Block-chaining cipher with padding that always adds 1..AES_BLOCK_SIZE bytes,
// so a block-aligned plaintext gains one full block.
class PayloadCipher
{
  public:
    virtual ~PayloadCipher() = default;

    virtual bool encrypt(const std::uint8_t               iv[IV_SIZE],
                         const std::vector<std::uint8_t> &plaintext,
                         std::vector<std::uint8_t>       &out) = 0;

    virtual bool decrypt(const std::uint8_t               iv[IV_SIZE],
                         const std::vector<std::uint8_t> &ciphertext,
                         std::vector<std::uint8_t>       &out) = 0;
};

// Unchained, unpadded 64-bit block cipher used to hide header bit fields.
class HeaderCipher
{
  public:
    virtual ~HeaderCipher() = default;

    virtual bool encrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                               std::uint8_t       out[HEADER_BLOCK_SIZE]) = 0;
    virtual bool decrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                               std::uint8_t       out[HEADER_BLOCK_SIZE]) = 0;
};

// PKCS#7 padding only, no enciphering. Output lengths match AesCbcCipher.
class NoopPayloadCipher : public PayloadCipher
{
  public:
    bool encrypt(const std::uint8_t * /*iv*/,
                 const std::vector<std::uint8_t> &plaintext,
                 std::vector<std::uint8_t>       &out) override
    {
        const std::size_t pad = AES_BLOCK_SIZE - plaintext.size() % AES_BLOCK_SIZE;
        out                   = plaintext;
        out.insert(out.end(), pad, static_cast<std::uint8_t>(pad));
        return true;
    }

    bool decrypt(const std::uint8_t * /*iv*/,
                 const std::vector<std::uint8_t> &ciphertext,
                 std::vector<std::uint8_t>       &out) override
    {
        if (ciphertext.empty() || ciphertext.size() % AES_BLOCK_SIZE != 0)
            return false;
        const std::size_t pad = ciphertext.back();
        if (pad == 0 || pad > AES_BLOCK_SIZE)
            return false;
        for (std::size_t i = ciphertext.size() - pad; i < ciphertext.size(); ++i)
        {
            if (ciphertext[i] != pad)
                return false;
        }
        out.assign(ciphertext.begin(), ciphertext.end() - pad);
        return true;
    }
};

class NoopHeaderCipher : public HeaderCipher
{
  public:
    bool encrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                       std::uint8_t       out[HEADER_BLOCK_SIZE]) override
    {
        std::copy(in, in + HEADER_BLOCK_SIZE, out);
        return true;
    }
    bool decrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                       std::uint8_t       out[HEADER_BLOCK_SIZE]) override
    {
        std::copy(in, in + HEADER_BLOCK_SIZE, out);
        return true;
    }
};

// OpenSSL AES-128-CBC, PKCS#7
class AesCbcCipher : public PayloadCipher
{
  public:
    explicit AesCbcCipher(const Key &key) : key_(key) {}
    ~AesCbcCipher() override { wipe_key(key_); }

    AesCbcCipher(const AesCbcCipher &)            = delete;
    AesCbcCipher &operator=(const AesCbcCipher &) = delete;

    bool encrypt(const std::uint8_t               iv[IV_SIZE],
                 const std::vector<std::uint8_t> &plaintext,
                 std::vector<std::uint8_t>       &out) override;

    bool decrypt(const std::uint8_t               iv[IV_SIZE],
                 const std::vector<std::uint8_t> &ciphertext,
                 std::vector<std::uint8_t>       &out) override;

  private:
    Key key_{};
};

// OpenSSL two-key Triple-DES, ECB, no padding
class DesEdeHeaderCipher : public HeaderCipher
{
  public:
    explicit DesEdeHeaderCipher(const Key &key) : key_(key) {}
    ~DesEdeHeaderCipher() override { wipe_key(key_); }

    DesEdeHeaderCipher(const DesEdeHeaderCipher &)            = delete;
    DesEdeHeaderCipher &operator=(const DesEdeHeaderCipher &) = delete;

    bool encrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                       std::uint8_t       out[HEADER_BLOCK_SIZE]) override;
    bool decrypt_block(const std::uint8_t in[HEADER_BLOCK_SIZE],
                       std::uint8_t       out[HEADER_BLOCK_SIZE]) override;

  private:
    Key key_{};
};

}  // namespace crypto
