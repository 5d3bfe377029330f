#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "util/status.hpp"

namespace payload
{

// --- Protocol ids ---
inline constexpr int INT64      = 0;
inline constexpr int RAW_BYTES  = 1;
inline constexpr int UTF8_TEXT  = 2;

// Kinds of value a protocol can carry; which one is valid is decided by the protocol id.
using Value = std::variant<std::string, std::vector<std::uint8_t>, std::int64_t>;

struct Handler
{
    std::function<cjkpost::Status(const Value &, std::vector<std::uint8_t> &)> render;
    std::function<cjkpost::Status(const std::vector<std::uint8_t> &, Value &)> interpret;
};

class Registry
{
  public:
    // Only UTF8_TEXT is registered
    static Registry with_defaults();

    // false if id is outside [0, 64), already taken, or the handler is incomplete
    bool add(int id, Handler h);

    const Handler *find(int id) const;

    cjkpost::Status render(int id, const Value &v, std::vector<std::uint8_t> &out) const;
    cjkpost::Status interpret(int id, const std::vector<std::uint8_t> &bytes, Value &out) const;

  private:
    std::map<int, Handler> handlers_;
};

// Handlers usable with Registry::add
Handler utf8_text_handler();
Handler raw_bytes_handler();
Handler int64_handler();

}  // namespace payload
