#include <process_error.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace {

using ::testing::HasSubstr;

TEST(ProcessError, Traceback)
{
    auto const error = pyshell::parse_error(
        "Traceback (most recent call last):\n"
        "  File \"x.py\", line 1\n"
        "ValueError: bad\n"
    );

    EXPECT_EQ(error.kind(), pyshell::ProcessErrc::InterpreterTraceback);
    EXPECT_STREQ(error.what(), "ValueError: bad");
    ASSERT_TRUE(error.traceback());
    EXPECT_EQ(*error.traceback(), "  File \"x.py\", line 1");
    EXPECT_THAT(error.diagnostic(), HasSubstr("ValueError: bad"));
    EXPECT_THAT(error.diagnostic(), HasSubstr("File \"x.py\", line 1"));
}

TEST(ProcessError, TracebackMultipleFrames)
{
    auto const error = pyshell::parse_error(
        "Traceback (most recent call last):\r\n"
        "  File \"main.py\", line 4, in <module>\r\n"
        "    f()\r\n"
        "  File \"main.py\", line 2, in f\r\n"
        "    raise KeyError('k')\r\n"
        "KeyError: 'k'\r\n"
    );

    EXPECT_STREQ(error.what(), "KeyError: 'k'");
    ASSERT_TRUE(error.traceback());
    EXPECT_EQ(
        *error.traceback(),
        "  File \"main.py\", line 4, in <module>\n"
        "    f()\n"
        "  File \"main.py\", line 2, in f\n"
        "    raise KeyError('k')"
    );
}

TEST(ProcessError, PlainTextVerbatim)
{
    auto const error = pyshell::parse_error("something went wrong\nsecond line\n");
    EXPECT_EQ(error.kind(), pyshell::ProcessErrc::AbnormalExit);
    EXPECT_STREQ(error.what(), "something went wrong\nsecond line\n");
    EXPECT_FALSE(error.traceback());
    EXPECT_EQ(error.diagnostic(), error.what());
}

TEST(ProcessError, MarkerMustLeadText)
{
    auto const error = pyshell::parse_error("warning\nTraceback (most recent call last):\nValueError: x\n");
    EXPECT_EQ(error.kind(), pyshell::ProcessErrc::AbnormalExit);
    EXPECT_FALSE(error.traceback());
}

TEST(ProcessError, Exited)
{
    auto const error = pyshell::ProcessError::exited(3);
    EXPECT_EQ(error.kind(), pyshell::ProcessErrc::AbnormalExit);
    EXPECT_STREQ(error.what(), "process exited with code 3");
}

TEST(ProcessError, Context)
{
    auto error = pyshell::ProcessError::exited(2);
    error.set_context("/usr/bin/python3", {"-u"}, "main.py", {"a", "b"}, 2);

    EXPECT_EQ(error.executable(), "/usr/bin/python3");
    EXPECT_THAT(error.interpreter_options(), ::testing::ElementsAre("-u"));
    EXPECT_EQ(error.script(), "main.py");
    EXPECT_THAT(error.args(), ::testing::ElementsAre("a", "b"));
    EXPECT_EQ(error.exit_code(), 2);
}

TEST(ProcessError, ErrorCategory)
{
    boost::system::error_code const ec = pyshell::ProcessErrc::SyntaxCheckFailure;
    EXPECT_EQ(ec.category().name(), std::string{"pyshell"});
    EXPECT_EQ(ec.message(), "syntax check failed");
    EXPECT_EQ(pyshell::parse_error("Traceback\nE").code(), make_error_code(pyshell::ProcessErrc::InterpreterTraceback));
}

} // namespace
