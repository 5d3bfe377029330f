#include <algorithm>

#include "proto/frag.hpp"
#include "proto/unit.hpp"
#include "util/log.hpp"

namespace frag
{

using cjkpost::Status;

void derive_iv(const HeaderBytes &hdr, std::uint8_t iv[crypto::IV_SIZE])
{
    std::copy(hdr.begin(), hdr.end(), iv);
    std::copy(hdr.begin(), hdr.end(), iv + HDR_SIZE);
}

Status Engine::encode(int protocol_id, const payload::Value &value, std::vector<std::string> &units)
{
    std::vector<std::uint8_t> plaintext;
    if (Status st = registry_.render(protocol_id, value, plaintext); st != Status::Ok)
        return st;
    return encode_bytes(protocol_id, plaintext, units);
}

Status Engine::decode(const std::vector<std::string> &units, Decoded &out)
{
    int                       protocol_id = 0;
    std::vector<std::uint8_t> plaintext;
    if (Status st = decode_bytes(units, protocol_id, plaintext); st != Status::Ok)
        return st;

    payload::Value value;
    if (Status st = registry_.interpret(protocol_id, plaintext, value); st != Status::Ok)
        return st;
    out.protocol_id = protocol_id;
    out.value       = std::move(value);
    return Status::Ok;
}

Status Engine::encode_bytes(int                              protocol_id,
                            const std::vector<std::uint8_t> &plaintext,
                            std::vector<std::string>        &units)
{
    // a payload of exactly SLOT_SIZE bytes already spills its padding block into a second unit
    const bool        single   = plaintext.size() < SLOT_SIZE;
    const std::size_t tail_len = single ? plaintext.size() : plaintext.size() % SLOT_SIZE;

    HeaderBytes terminal{};
    if (Status st = headers_.encode(tail_len, protocol_id, false, terminal); st != Status::Ok)
        return st;

    std::uint8_t iv[crypto::IV_SIZE];
    derive_iv(terminal, iv);
    std::vector<std::uint8_t> ciphertext;
    if (!cipher_.encrypt(iv, plaintext, ciphertext))
    {
        LOG_ERROR("payload encrypt failed (%zu bytes)", plaintext.size());
        return Status::CryptoFailure;
    }

    std::vector<std::string> out;
    out.reserve(ciphertext.size() / SLOT_SIZE + 1);
    for (std::size_t start = 0; start < ciphertext.size(); start += SLOT_SIZE)
    {
        const std::size_t take    = std::min(SLOT_SIZE, ciphertext.size() - start);
        const bool        is_last = (start + take == ciphertext.size());

        HeaderBytes hdr = terminal;
        if (!is_last)
        {
            if (Status st = headers_.encode_dummy(hdr); st != Status::Ok)
                return st;
        }
        std::vector<std::uint8_t> chunk(ciphertext.begin() + start,
                                        ciphertext.begin() + start + take);
        std::string               unit;
        if (Status st = pack_unit(hdr, chunk, rng_, unit); st != Status::Ok)
            return st;
        out.push_back(std::move(unit));
    }

    LOG_DEBUG("encoded %zu bytes (protocol %d) into %zu unit(s)", plaintext.size(), protocol_id,
              out.size());
    units = std::move(out);
    return Status::Ok;
}

Status Engine::decode_bytes(const std::vector<std::string> &units,
                            int                            &protocol_id,
                            std::vector<std::uint8_t>      &plaintext)
{
    if (units.empty())
    {
        LOG_WARN("empty unit sequence");
        return Status::ProtocolViolation;
    }

    HeaderBytes               terminal{};
    HeaderFields              fields;
    std::vector<std::uint8_t> tail;
    if (Status st = open_terminal(units.back(), terminal, fields, tail); st != Status::Ok)
        return st;

    std::vector<std::uint8_t> ciphertext;
    ciphertext.reserve((units.size() - 1) * SLOT_SIZE + tail.size());
    for (std::size_t i = 0; i + 1 < units.size(); ++i)
    {
        HeaderBytes               hdr{};
        HeaderFields              f;
        std::vector<std::uint8_t> slot;
        if (Status st = unpack_unit(units[i], hdr, slot); st != Status::Ok)
            return st;
        if (Status st = headers_.decode(hdr, f); st != Status::Ok)
            return st;
        if (!f.more)
        {
            LOG_WARN("inconsistent fragment sequence: unit %zu of %zu is terminal", i + 1,
                     units.size());
            return Status::ProtocolViolation;
        }
        ciphertext.insert(ciphertext.end(), slot.begin(), slot.end());
    }
    ciphertext.insert(ciphertext.end(), tail.begin(), tail.end());

    std::uint8_t iv[crypto::IV_SIZE];
    derive_iv(terminal, iv);
    std::vector<std::uint8_t> out;
    if (!cipher_.decrypt(iv, ciphertext, out))
    {
        LOG_ERROR("payload decrypt failed (%zu unit(s))", units.size());
        return Status::CryptoFailure;
    }

    LOG_DEBUG("decoded %zu unit(s) into %zu bytes (protocol %u)", units.size(), out.size(),
              static_cast<unsigned>(fields.protocol_id));
    protocol_id = fields.protocol_id;
    plaintext   = std::move(out);
    return Status::Ok;
}

Status Engine::open_terminal(std::string_view           unit,
                             HeaderBytes               &hdr,
                             HeaderFields              &fields,
                             std::vector<std::uint8_t> &chunk)
{
    std::vector<std::uint8_t> slot;
    if (Status st = unpack_unit(unit, hdr, slot); st != Status::Ok)
        return st;
    if (Status st = headers_.decode(hdr, fields); st != Status::Ok)
        return st;
    if (fields.more)
    {
        LOG_WARN("last unit does not carry a terminal header");
        return Status::ProtocolViolation;
    }
    const std::size_t len = fields.slot_len();
    if (len == 0 || len > SLOT_SIZE)
    {
        LOG_WARN("terminal header announces %zu slot bytes", len);
        return Status::ProtocolViolation;
    }
    chunk.assign(slot.begin(), slot.begin() + len);
    return Status::Ok;
}

}  // namespace frag
