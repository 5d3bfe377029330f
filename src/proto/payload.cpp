#include "proto/header.hpp"
#include "proto/payload.hpp"
#include "util/log.hpp"

namespace payload
{

using cjkpost::Status;

Registry Registry::with_defaults()
{
    Registry r;
    if (!r.add(UTF8_TEXT, utf8_text_handler()))
        LOG_ERROR("failed to register protocol %d", UTF8_TEXT);
    return r;
}

bool Registry::add(int id, Handler h)
{
    if (id < 0 || id >= frag::PROTOCOL_LIMIT || !h.render || !h.interpret)
        return false;
    return handlers_.emplace(id, std::move(h)).second;
}

const Handler *Registry::find(int id) const
{
    auto it = handlers_.find(id);
    return it == handlers_.end() ? nullptr : &it->second;
}

Status Registry::render(int id, const Value &v, std::vector<std::uint8_t> &out) const
{
    const Handler *h = find(id);
    if (!h)
    {
        LOG_ERROR("unsupported protocol id %d", id);
        return Status::UnsupportedProtocol;
    }
    return h->render(v, out);
}

Status Registry::interpret(int id, const std::vector<std::uint8_t> &bytes, Value &out) const
{
    const Handler *h = find(id);
    if (!h)
    {
        LOG_ERROR("unsupported protocol id %d", id);
        return Status::UnsupportedProtocol;
    }
    return h->interpret(bytes, out);
}

Handler utf8_text_handler()
{
    Handler h;
    h.render = [](const Value &v, std::vector<std::uint8_t> &out) -> Status {
        const auto *s = std::get_if<std::string>(&v);
        if (!s)
            return Status::InvalidInput;
        out.assign(s->begin(), s->end());
        return Status::Ok;
    };
    h.interpret = [](const std::vector<std::uint8_t> &bytes, Value &out) -> Status {
        out = std::string(bytes.begin(), bytes.end());
        return Status::Ok;
    };
    return h;
}

Handler raw_bytes_handler()
{
    Handler h;
    h.render = [](const Value &v, std::vector<std::uint8_t> &out) -> Status {
        const auto *b = std::get_if<std::vector<std::uint8_t>>(&v);
        if (!b)
            return Status::InvalidInput;
        out = *b;
        return Status::Ok;
    };
    h.interpret = [](const std::vector<std::uint8_t> &bytes, Value &out) -> Status {
        out = bytes;
        return Status::Ok;
    };
    return h;
}

// 8 bytes, big-endian two's complement
Handler int64_handler()
{
    Handler h;
    h.render = [](const Value &v, std::vector<std::uint8_t> &out) -> Status {
        const auto *n = std::get_if<std::int64_t>(&v);
        if (!n)
            return Status::InvalidInput;
        const auto u = static_cast<std::uint64_t>(*n);
        out.resize(8);
        for (int i = 0; i < 8; ++i)
            out[i] = static_cast<std::uint8_t>(u >> (8 * (7 - i)));
        return Status::Ok;
    };
    h.interpret = [](const std::vector<std::uint8_t> &bytes, Value &out) -> Status {
        if (bytes.size() != 8)
            return Status::InvalidInput;
        std::uint64_t u = 0;
        for (std::uint8_t b : bytes)
            u = (u << 8) | b;
        out = static_cast<std::int64_t>(u);
        return Status::Ok;
    };
    return h;
}

}  // namespace payload
