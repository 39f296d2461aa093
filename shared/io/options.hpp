#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace shared::io {

// Per-call encode/decode configuration. Each schema kind recognizes one
// alternative; std::monostate means "use the schema default".

struct IntOptions {
    bool varint{false};
};

struct StringOptions {
    // In UTF-16 code units. Unset means the protocol default.
    std::optional<std::size_t> maxLen{};
};

enum class LengthMode : std::uint8_t {
    VarIntPrefixed = 0,
    Fixed = 1,
    // Consume every byte left in the enclosing packet body.
    Remaining = 2,
};

struct ListOptions {
    LengthMode length{LengthMode::VarIntPrefixed};
    std::size_t fixedCount{0};
    std::optional<std::size_t> maxLen{};
};

enum class TagMode : std::uint8_t {
    // One byte, 0 or 1.
    Bool = 0,
    // Presence comes from an earlier boolean sibling field.
    External = 1,
    // Present iff bytes remain in the enclosing packet body.
    Remaining = 2,
};

struct OptionalOptions {
    TagMode tag{TagMode::Bool};
    std::string presentIf{};
};

using Options = std::variant<std::monostate, IntOptions, StringOptions, ListOptions, OptionalOptions>;

} // namespace shared::io
