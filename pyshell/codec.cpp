#include "codec.hpp"

#include <stdexcept>

namespace pyshell {

namespace {

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename F>
auto resolve(Mode const mode, std::optional<CodecSpec<F>> const& spec, auto builtin) -> F
{
    if (not spec)
    {
        return builtin(mode);
    }
    return std::visit(overloaded{
        [&](Mode const m) -> F { return builtin(m); },
        [](F const& f) -> F { return f; },
    }, *spec);
}

} // namespace

auto mode_from_string(std::string_view const name) -> std::optional<Mode>
{
    if (name == "text") return Mode::Text;
    if (name == "json") return Mode::Json;
    if (name == "binary") return Mode::Binary;
    return std::nullopt;
}

auto to_string(Mode const mode) -> char const*
{
    switch (mode)
    {
    case Mode::Text:
        return "text";
    case Mode::Json:
        return "json";
    case Mode::Binary:
        return "binary";
    default:
        return "(unknown mode)";
    }
}

auto format::text(Message const& message) -> std::string
{
    if (message.is_null())
    {
        return {};
    }
    if (message.is_string())
    {
        return message.get<std::string>();
    }
    return message.dump();
}

auto format::json(Message const& message) -> std::string
{
    return message.dump();
}

auto format::binary(Message const& message) -> std::string
{
    if (not message.is_string())
    {
        throw std::invalid_argument{"binary mode messages must be strings"};
    }
    return message.get<std::string>();
}

auto parse::text(std::string_view const record) -> Message
{
    return Message(std::string{record});
}

auto parse::json(std::string_view const record) -> Message
{
    return Message::parse(record.begin(), record.end());
}

auto builtin_formatter(Mode const mode) -> Formatter
{
    switch (mode)
    {
    case Mode::Text:
        return format::text;
    case Mode::Json:
        return format::json;
    default:
        return {};
    }
}

auto builtin_parser(Mode const mode) -> Parser
{
    switch (mode)
    {
    case Mode::Text:
        return parse::text;
    case Mode::Json:
        return parse::json;
    default:
        return {};
    }
}

auto resolve_codec(
    Mode const mode,
    std::optional<CodecSpec<Formatter>> const& formatter,
    std::optional<CodecSpec<Parser>> const& parser,
    std::optional<CodecSpec<Parser>> const& stderr_parser
) -> Codec
{
    return Codec{
        .formatter = resolve(mode, formatter, builtin_formatter),
        .parser = resolve(mode, parser, builtin_parser),
        .stderr_parser = resolve(mode, stderr_parser, builtin_parser),
    };
}

} // namespace pyshell
