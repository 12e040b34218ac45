#pragma once
/**
 * @file codec.hpp
 * @brief Record encoding and decoding for session traffic
 *
 * Outbound messages are turned into record text by a formatter and
 * inbound records are turned into messages by a parser. Each role is
 * picked when a session is created, either from a built-in mode or
 * from a caller-supplied callable.
 */

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pyshell {

/// @brief Decoded record value
using Message = nlohmann::json;

/// @brief Built-in record encodings
enum class Mode
{
    Text,
    Json,
    Binary,
};

using Formatter = std::function<std::string(Message const&)>;
using Parser = std::function<Message(std::string_view)>;

/// @brief Either a built-in codec selected by mode or a custom callable
template <typename F>
using CodecSpec = std::variant<Mode, F>;

/**
 * @brief Codec resolved for a single session
 *
 * An empty formatter writes string messages as raw bytes. An empty
 * parser means inbound records are not decoded at all.
 */
struct Codec
{
    Formatter formatter;
    Parser parser;
    Parser stderr_parser;
};

/**
 * @brief Parse a mode name
 *
 * @param name One of "text", "json", or "binary"
 * @return Matching mode or nullopt when unknown
 */
auto mode_from_string(std::string_view name) -> std::optional<Mode>;

auto to_string(Mode mode) -> char const*;

namespace format {

/// @brief Strings are passed through, null is empty, other values use JSON text
auto text(Message const& message) -> std::string;

/// @brief Compact JSON serialization
auto json(Message const& message) -> std::string;

/// @brief Raw bytes of a string message
/// @throw std::invalid_argument when the message is not a string
auto binary(Message const& message) -> std::string;

} // namespace format

namespace parse {

/// @brief Record text as a JSON string value
auto text(std::string_view record) -> Message;

/// @brief Record text parsed as a JSON document
/// @throw nlohmann::json::parse_error on malformed input
auto json(std::string_view record) -> Message;

} // namespace parse

/**
 * @brief Built-in formatter for a mode
 *
 * @return formatter, empty for binary mode
 */
auto builtin_formatter(Mode mode) -> Formatter;

/**
 * @brief Built-in parser for a mode
 *
 * @return parser, empty for binary mode
 */
auto builtin_parser(Mode mode) -> Parser;

/**
 * @brief Resolve the codec for a session
 *
 * Each absent override falls back to the built-in for the session
 * mode. Built-in overrides select the built-in for that role and
 * callables are used as given.
 *
 * @param mode Session mode
 * @param formatter Optional formatter override
 * @param parser Optional stdout parser override
 * @param stderr_parser Optional stderr parser override
 * @return Resolved codec
 */
auto resolve_codec(
    Mode mode,
    std::optional<CodecSpec<Formatter>> const& formatter,
    std::optional<CodecSpec<Parser>> const& parser,
    std::optional<CodecSpec<Parser>> const& stderr_parser
) -> Codec;

} // namespace pyshell
