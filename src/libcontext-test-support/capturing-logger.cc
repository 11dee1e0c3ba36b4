#include "awsctx/context/tests/capturing-logger.hh"
#include "awsctx/util/terminal.hh"

#include <sstream>

namespace awsctx::testing {

void CapturingLogger::log(Verbosity lvl, std::string_view s)
{
    _entries.lock()->push_back({lvl, filterANSIEscapes(s, true)});
}

void CapturingLogger::logEI(const ErrorInfo & ei)
{
    std::ostringstream oss;
    showErrorInfo(oss, ei, false);
    log(ei.level, oss.str());
}

std::vector<CapturingLogger::Entry> CapturingLogger::entries()
{
    return *_entries.lock();
}

bool CapturingLogger::contains(Verbosity level, std::string_view substring)
{
    auto entries_(_entries.lock());
    for (auto & entry : *entries_)
        if (entry.level == level && entry.msg.find(substring) != std::string::npos)
            return true;
    return false;
}

void WithCapturingLogger::SetUp()
{
    auto capturing = std::make_unique<CapturingLogger>();
    capturedLog = capturing.get();
    savedLogger = std::move(logger);
    logger = std::move(capturing);
    savedVerbosity = verbosity;
    verbosity = lvlVomit;
}

void WithCapturingLogger::TearDown()
{
    logger = std::move(savedLogger);
    verbosity = savedVerbosity;
    capturedLog = nullptr;
}

} // namespace awsctx::testing
