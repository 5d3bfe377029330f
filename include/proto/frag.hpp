#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/cipher.hpp"
#include "crypto/random.hpp"
#include "proto/header.hpp"
#include "proto/payload.hpp"
#include "util/status.hpp"

/*
ENCODE:
registry.render(protocol_id, value) -> plaintext
  -> terminal header from (len < SLOT_SIZE ? len : len % SLOT_SIZE)
     -> cipher.encrypt(iv = hdr||hdr, plaintext)   // one chaining run over the whole payload
        -> split ciphertext into SLOT_SIZE chunks
           -> pack_unit(dummy header, chunk) for every chunk but the last
           -> pack_unit(terminal header, last chunk)

DECODE:
units.back() -> terminal header (more must be 0) -> slot length, protocol id
units[0..n-1) -> dummy headers (more must be 1), full slots
  -> concatenate, cipher.decrypt(iv = terminal||terminal)
     -> registry.interpret(protocol_id, plaintext)
*/

namespace frag
{

struct Decoded
{
    int            protocol_id{0};
    payload::Value value;
};

// IV for the payload cipher: the terminal header, twice
void derive_iv(const HeaderBytes &hdr, std::uint8_t iv[crypto::IV_SIZE]);

class Engine
{
  public:
    Engine(crypto::PayloadCipher   &cipher,
           crypto::HeaderCipher    &hdr_cipher,
           crypto::RandomSource    &rng,
           const payload::Registry &registry)
        : cipher_(cipher), headers_(hdr_cipher, rng), rng_(rng), registry_(registry)
    {
    }

    // Each output string is exactly UNIT_CODEPOINTS codepoints, in chunk order.
    cjkpost::Status encode(int                       protocol_id,
                           const payload::Value     &value,
                           std::vector<std::string> &units);

    // units.back() is the terminal unit; order is taken as given.
    cjkpost::Status decode(const std::vector<std::string> &units, Decoded &out);

    // Same framing without the registry's render/interpret step
    cjkpost::Status encode_bytes(int                              protocol_id,
                                 const std::vector<std::uint8_t> &plaintext,
                                 std::vector<std::string>        &units);
    cjkpost::Status decode_bytes(const std::vector<std::string> &units,
                                 int                            &protocol_id,
                                 std::vector<std::uint8_t>      &plaintext);

  private:
    cjkpost::Status open_terminal(std::string_view           unit,
                                  HeaderBytes               &hdr,
                                  HeaderFields              &fields,
                                  std::vector<std::uint8_t> &chunk);

    crypto::PayloadCipher   &cipher_;
    HeaderCodec              headers_;
    crypto::RandomSource    &rng_;
    const payload::Registry &registry_;
};

}  // namespace frag
