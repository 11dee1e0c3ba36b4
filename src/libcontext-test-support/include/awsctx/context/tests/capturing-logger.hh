#pragma once
///@file

#include "awsctx/util/logging.hh"
#include "awsctx/util/sync.hh"

#include <gtest/gtest.h>

#include <vector>

namespace awsctx::testing {

/**
 * A logger that keeps every message it is given, with ANSI escapes
 * removed.
 */
class CapturingLogger : public Logger
{
public:

    struct Entry
    {
        Verbosity level;
        std::string msg;
    };

    void log(Verbosity lvl, std::string_view s) override;

    void logEI(const ErrorInfo & ei) override;

    std::vector<Entry> entries();

    /**
     * @return Whether some message at `level` contains `substring`.
     */
    bool contains(Verbosity level, std::string_view substring);

private:

    Sync<std::vector<Entry>> _entries;
};

/**
 * Test fixture mixin that installs a `CapturingLogger` as the global
 * logger at `lvlVomit` for the duration of a test.
 */
class WithCapturingLogger : public virtual ::testing::Test
{
    std::unique_ptr<Logger> savedLogger;
    Verbosity savedVerbosity;

protected:

    CapturingLogger * capturedLog = nullptr;

    void SetUp() override;

    void TearDown() override;
};

} // namespace awsctx::testing
