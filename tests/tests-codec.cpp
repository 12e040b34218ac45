#include <codec.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

using pyshell::Message;
using pyshell::Mode;

TEST(Codec, TextFormat)
{
    EXPECT_EQ(pyshell::format::text("hello"), "hello");
    EXPECT_EQ(pyshell::format::text(nullptr), "");
    EXPECT_EQ(pyshell::format::text(42), "42");
    EXPECT_EQ(pyshell::format::text(Message{{"a", 1}}), "{\"a\":1}");
}

TEST(Codec, TextParse)
{
    EXPECT_EQ(pyshell::parse::text("{\"a\":1}"), Message("{\"a\":1}"));
    EXPECT_EQ(pyshell::parse::text(""), Message(""));
}

TEST(Codec, JsonRoundTrip)
{
    auto const value = Message{{"a", 1}, {"b", {true, nullptr, "x"}}};
    auto const text = pyshell::format::json(value);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(pyshell::parse::json(text), value);
}

TEST(Codec, JsonParseFailure)
{
    EXPECT_THROW(pyshell::parse::json("{not json"), nlohmann::json::parse_error);
}

TEST(Codec, BinaryFormat)
{
    EXPECT_EQ(pyshell::format::binary(std::string{"\0\x01\xff", 3}), std::string("\0\x01\xff", 3));
    EXPECT_THROW(pyshell::format::binary(1), std::invalid_argument);
}

TEST(Codec, ModeNames)
{
    EXPECT_EQ(pyshell::mode_from_string("text"), Mode::Text);
    EXPECT_EQ(pyshell::mode_from_string("json"), Mode::Json);
    EXPECT_EQ(pyshell::mode_from_string("binary"), Mode::Binary);
    EXPECT_EQ(pyshell::mode_from_string("yaml"), std::nullopt);
    EXPECT_STREQ(pyshell::to_string(Mode::Json), "json");
}

TEST(Codec, ResolveDefaultsFollowMode)
{
    auto const text = pyshell::resolve_codec(Mode::Text, {}, {}, {});
    EXPECT_EQ(text.formatter(Message{{"a", 1}}), "{\"a\":1}");
    EXPECT_EQ(text.parser("{\"a\":1}"), Message("{\"a\":1}"));
    EXPECT_EQ(text.stderr_parser("oops"), Message("oops"));

    auto const json = pyshell::resolve_codec(Mode::Json, {}, {}, {});
    EXPECT_EQ(json.formatter("x"), "\"x\"");
    EXPECT_EQ(json.parser("{\"a\":1}"), (Message{{"a", 1}}));
    EXPECT_EQ(json.stderr_parser("[1]"), (Message::array({1})));
}

TEST(Codec, ResolveBinaryHasNoDecoders)
{
    auto const binary = pyshell::resolve_codec(Mode::Binary, {}, {}, {});
    EXPECT_FALSE(binary.formatter);
    EXPECT_FALSE(binary.parser);
    EXPECT_FALSE(binary.stderr_parser);
}

TEST(Codec, ResolveBuiltinOverride)
{
    // json records on stdout but plain text diagnostics on stderr
    auto const codec = pyshell::resolve_codec(Mode::Json, {}, {}, Mode::Text);
    EXPECT_EQ(codec.parser("1"), Message(1));
    EXPECT_EQ(codec.stderr_parser("1"), Message("1"));
}

TEST(Codec, ResolveCustomCallables)
{
    pyshell::Formatter const shout = [](Message const& m) { return "!" + m.get<std::string>(); };
    pyshell::Parser const length = [](std::string_view const line) { return Message(line.size()); };

    auto const codec = pyshell::resolve_codec(Mode::Text, shout, length, {});
    EXPECT_EQ(codec.formatter("hi"), "!hi");
    EXPECT_EQ(codec.parser("four"), Message(4));
    EXPECT_EQ(codec.stderr_parser("four"), Message("four"));
}

} // namespace
