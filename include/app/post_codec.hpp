#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/cipher.hpp"
#include "crypto/key.hpp"
#include "crypto/random.hpp"
#include "proto/frag.hpp"
#include "proto/payload.hpp"

namespace app
{

// Owns the production ciphers, the random source and the registry behind one frag::Engine.
class PostCodec
{
  public:
    explicit PostCodec(const crypto::Key &key);

    // CJKPOST_KEY if set (nullopt when malformed), otherwise the built-in key
    static std::optional<PostCodec> FromEnv();

    PostCodec(PostCodec &&)            = default;
    PostCodec &operator=(PostCodec &&) = default;

    cjkpost::Status encode(int                       protocol_id,
                           const payload::Value     &value,
                           std::vector<std::string> &units);
    cjkpost::Status decode(const std::vector<std::string> &units, frag::Decoded &out);

    cjkpost::Status encode_text(std::string_view text, std::vector<std::string> &units);

    cjkpost::Status random_unit(std::string &out);

    // Extra protocols become visible to subsequent encode/decode calls
    payload::Registry &registry() { return *registry_; }

  private:
    // heap-held so the engine's references survive a move
    std::unique_ptr<crypto::AesCbcCipher>       cipher_;
    std::unique_ptr<crypto::DesEdeHeaderCipher> hdr_cipher_;
    std::unique_ptr<crypto::SodiumRandom>       rng_;
    std::unique_ptr<payload::Registry>          registry_;
    std::unique_ptr<frag::Engine>               engine_;
};

}  // namespace app
