#include <cstdlib>
#include <utility>

#include "app/post_codec.hpp"
#include "proto/unit.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

PostCodec::PostCodec(const crypto::Key &key)
    : cipher_(std::make_unique<crypto::AesCbcCipher>(key)),
      hdr_cipher_(std::make_unique<crypto::DesEdeHeaderCipher>(key)),
      rng_(std::make_unique<crypto::SodiumRandom>()),
      registry_(std::make_unique<payload::Registry>(payload::Registry::with_defaults())),
      engine_(std::make_unique<frag::Engine>(*cipher_, *hdr_cipher_, *rng_, *registry_))
{
}

std::optional<PostCodec> PostCodec::FromEnv()
{
    cjkpost::set_log_level_from_env();

    std::optional<crypto::Key> key;
    if (std::getenv(constants::ENV_KEY))
    {
        key = crypto::key_from_env(constants::ENV_KEY);
        if (!key)
            return std::nullopt;
    }
    else
    {
        LOG_WARN("%s not set, using the built-in key", constants::ENV_KEY);
        key = crypto::key_from_hex(constants::DEFAULT_KEY_HEX);
        if (!key)
            return std::nullopt;
    }

    std::optional<PostCodec> codec{std::in_place, *key};
    crypto::wipe_key(*key);
    return codec;
}

cjkpost::Status PostCodec::encode(int                       protocol_id,
                                  const payload::Value     &value,
                                  std::vector<std::string> &units)
{
    return engine_->encode(protocol_id, value, units);
}

cjkpost::Status PostCodec::decode(const std::vector<std::string> &units, frag::Decoded &out)
{
    return engine_->decode(units, out);
}

cjkpost::Status PostCodec::encode_text(std::string_view text, std::vector<std::string> &units)
{
    return engine_->encode(payload::UTF8_TEXT, payload::Value{std::string(text)}, units);
}

cjkpost::Status PostCodec::random_unit(std::string &out)
{
    return frag::random_unit(*rng_, out);
}

}  // namespace app
