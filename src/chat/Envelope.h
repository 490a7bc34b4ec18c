#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace textrelay::chat {

enum class Kind { Join, Leave, Msg, Pm, Typing, StopTyping, Sys };

// Wire names: "join", "leave", "msg", "pm", "typing", "stop_typing", "sys".
const char* to_string(Kind kind) noexcept;
std::optional<Kind> kind_from_string(std::string_view name) noexcept;

struct Envelope {
    Kind kind = Kind::Sys;
    std::string from;                  // omitted on the wire when empty
    std::optional<std::string> to;     // pm target
    std::optional<std::string> text;
    std::int64_t timestamp = 0;        // unix seconds
};

// One envelope -> one JSON line (no trailing newline).
std::string encode(const Envelope& env);

// Empty result for anything that is not a JSON object with a known "Type".
// Unknown keys are ignored.
std::optional<Envelope> decode(std::string_view line);

std::int64_t unix_now();

// Server-originated envelopes, stamped with unix_now().
Envelope make_join(std::string user, std::string text);
Envelope make_leave(std::string user);
Envelope make_sys(std::string text);

} // namespace textrelay::chat
