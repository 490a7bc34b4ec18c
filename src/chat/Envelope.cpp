#include "chat/Envelope.h"

#include <boost/json.hpp>

#include <chrono>
#include <limits>
#include <utility>

namespace textrelay::chat {

namespace json = boost::json;

namespace {

struct KindName {
    Kind kind;
    std::string_view name;
};

constexpr KindName kKindNames[] = {
    {Kind::Join, "join"},
    {Kind::Leave, "leave"},
    {Kind::Msg, "msg"},
    {Kind::Pm, "pm"},
    {Kind::Typing, "typing"},
    {Kind::StopTyping, "stop_typing"},
    {Kind::Sys, "sys"},
};

json::string_view as_view(const std::string& s) {
    return json::string_view(s.data(), s.size());
}

// Absent and null both leave `out` untouched. Any non-string value fails.
bool read_string(const json::object& obj, const char* key, std::optional<std::string>& out) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return true;

    const json::string* s = v->if_string();
    if (!s) return false;

    out = std::string(s->data(), s->size());
    return true;
}

bool read_timestamp(const json::object& obj, std::int64_t& out) {
    const json::value* v = obj.if_contains("Ts");
    if (!v || v->is_null()) return true;

    if (const std::int64_t* i = v->if_int64()) {
        out = *i;
        return true;
    }
    if (const std::uint64_t* u = v->if_uint64()) {
        if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return false;
        out = static_cast<std::int64_t>(*u);
        return true;
    }
    return false;
}

} // namespace

const char* to_string(Kind kind) noexcept {
    switch (kind) {
        case Kind::Join:       return "join";
        case Kind::Leave:      return "leave";
        case Kind::Msg:        return "msg";
        case Kind::Pm:         return "pm";
        case Kind::Typing:     return "typing";
        case Kind::StopTyping: return "stop_typing";
        case Kind::Sys:        return "sys";
    }
    return "sys";
}

std::optional<Kind> kind_from_string(std::string_view name) noexcept {
    for (const auto& entry : kKindNames) {
        if (entry.name == name) return entry.kind;
    }
    return std::nullopt;
}

std::string encode(const Envelope& env) {
    json::object obj;
    obj["Type"] = json::string_view(to_string(env.kind));
    if (!env.from.empty()) obj["From"] = as_view(env.from);
    if (env.to) obj["To"] = as_view(*env.to);
    if (env.text) obj["Text"] = as_view(*env.text);
    obj["Ts"] = env.timestamp;
    return json::serialize(obj);
}

std::optional<Envelope> decode(std::string_view line) {
    json::error_code ec;
    json::value v = json::parse(json::string_view(line.data(), line.size()), ec);
    if (ec) return std::nullopt;

    const json::object* obj = v.if_object();
    if (!obj) return std::nullopt;

    const json::value* type = obj->if_contains("Type");
    if (!type || !type->is_string()) return std::nullopt;

    const json::string& type_name = type->get_string();
    auto kind = kind_from_string(std::string_view(type_name.data(), type_name.size()));
    if (!kind) return std::nullopt;

    Envelope env;
    env.kind = *kind;

    std::optional<std::string> from;
    if (!read_string(*obj, "From", from)) return std::nullopt;
    if (from) env.from = std::move(*from);

    if (!read_string(*obj, "To", env.to)) return std::nullopt;
    if (!read_string(*obj, "Text", env.text)) return std::nullopt;
    if (!read_timestamp(*obj, env.timestamp)) return std::nullopt;

    return env;
}

std::int64_t unix_now() {
    using namespace std::chrono;
    return static_cast<std::int64_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count()
    );
}

Envelope make_join(std::string user, std::string text) {
    Envelope env;
    env.kind = Kind::Join;
    env.from = std::move(user);
    env.text = std::move(text);
    env.timestamp = unix_now();
    return env;
}

Envelope make_leave(std::string user) {
    Envelope env;
    env.kind = Kind::Leave;
    env.text = user + " left";
    env.from = std::move(user);
    env.timestamp = unix_now();
    return env;
}

Envelope make_sys(std::string text) {
    Envelope env;
    env.kind = Kind::Sys;
    env.text = std::move(text);
    env.timestamp = unix_now();
    return env;
}

} // namespace textrelay::chat
