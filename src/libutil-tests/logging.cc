#include "awsctx/util/error.hh"
#include "awsctx/util/logging.hh"
#include "awsctx/util/terminal.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace awsctx {

/* ----------------------------------------------------------------------------
 * Error
 * --------------------------------------------------------------------------*/

TEST(Error, messageInterpolatesArguments)
{
    Error e("cannot write setting '%s' in scope %s", "aws.profile", "global");

    ASSERT_EQ(filterANSIEscapes(e.message(), true), "cannot write setting 'aws.profile' in scope global");
    ASSERT_EQ(filterANSIEscapes(e.msg(), true), "error: cannot write setting 'aws.profile' in scope global");
}

TEST(Error, addTraceIsPrintedOutermostFirst)
{
    Error e("disk full");
    e.addTrace("while writing '%s'", "inner");
    e.addTrace("while writing '%s'", "outer");

    std::ostringstream oss;
    showErrorInfo(oss, e.info(), true);
    auto out = filterANSIEscapes(oss.str(), true);

    auto outer = out.find("outer");
    auto inner = out.find("inner");
    ASSERT_NE(outer, std::string::npos);
    ASSERT_NE(inner, std::string::npos);
    ASSERT_LT(outer, inner);
    ASSERT_NE(out.find("error: disk full"), std::string::npos);
}

TEST(Error, addTraceInvalidatesRendering)
{
    Error e("disk full");
    ASSERT_EQ(filterANSIEscapes(e.msg(), true), "error: disk full");

    e.addTrace("while writing setting '%s'", "aws.profile");

    ASSERT_NE(filterANSIEscapes(e.msg(), true).find("while writing setting 'aws.profile'"), std::string::npos);
}

TEST(Error, tracesAreTruncatedWithoutShowTrace)
{
    Error e("failure");
    for (int i = 0; i < 5; i++)
        e.addTrace("trace %d", i);

    std::ostringstream oss;
    showErrorInfo(oss, e.info(), false);
    auto out = filterANSIEscapes(oss.str(), true);

    ASSERT_EQ(out.find("trace 4"), std::string::npos);
    ASSERT_NE(out.find("trace 0"), std::string::npos);
    ASSERT_NE(out.find("trace truncated"), std::string::npos);
}

TEST(SysError, includesStrerror)
{
    SysError e(ENOENT, "opening file '%s'", "/nonexistent");

    ASSERT_NE(filterANSIEscapes(e.message(), true).find("No such file or directory"), std::string::npos);
    ASSERT_EQ(e.errNo, ENOENT);
}

/* ----------------------------------------------------------------------------
 * ignoreException
 * --------------------------------------------------------------------------*/

class IgnoreExceptionTest : public ::testing::Test
{
    struct Collector : Logger
    {
        std::vector<std::pair<Verbosity, std::string>> & lines;

        Collector(std::vector<std::pair<Verbosity, std::string>> & lines)
            : lines(lines)
        {
        }

        void log(Verbosity lvl, std::string_view s) override
        {
            lines.emplace_back(lvl, filterANSIEscapes(s, true));
        }

        void logEI(const ErrorInfo & ei) override {}
    };

    std::unique_ptr<Logger> savedLogger;

protected:
    std::vector<std::pair<Verbosity, std::string>> lines;

    void SetUp() override
    {
        savedLogger = std::move(logger);
        logger = std::make_unique<Collector>(lines);
    }

    void TearDown() override
    {
        logger = std::move(savedLogger);
    }
};

TEST_F(IgnoreExceptionTest, logsErrorsAtTheGivenLevel)
{
    try {
        throw Error("listener failed");
    } catch (...) {
        ignoreException(lvlWarn);
    }

    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].first, lvlWarn);
    ASSERT_NE(lines[0].second.find("listener failed"), std::string::npos);
}

TEST_F(IgnoreExceptionTest, swallowsNonStandardExceptions)
{
    ASSERT_NO_THROW({
        try {
            throw 42;
        } catch (...) {
            ignoreException(lvlWarn);
        }
    });

    ASSERT_EQ(lines.size(), 1u);
    ASSERT_NE(lines[0].second.find("unknown exception"), std::string::npos);
}

/* ----------------------------------------------------------------------------
 * filterANSIEscapes
 * --------------------------------------------------------------------------*/

TEST(filterANSIEscapes, keepsColoursUnlessFilteringAll)
{
    std::string s = ANSI_RED "error:" ANSI_NORMAL " disk full\r";

    ASSERT_EQ(filterANSIEscapes(s, false), ANSI_RED "error:" ANSI_NORMAL " disk full");
    ASSERT_EQ(filterANSIEscapes(s, true), "error: disk full");
}

TEST(filterANSIEscapes, dropsNonColourSequences)
{
    ASSERT_EQ(filterANSIEscapes("\e[2Kdone\eM", false), "done");
}

} // namespace awsctx
