#pragma once
#include <string>
#include <map>
#include <memory>
#include <mutex>

namespace evalbox {

// Test identifier -> status tag (PASSED, FAILED, ERROR, SKIPPED, XFAIL).
using TestStatusMap = std::map<std::string, std::string>;

enum class LogFormat {
    PytestSummary,   // "short test summary info" section of `pytest -rA`
    PytestVerbose,   // status-prefixed or status-suffixed lines anywhere in the log
    Django,          // unittest runner "test (module.Class) ... ok"
    Sympy,           // bin/test "test_x ok" plus "___ path.py:test_y ___" failure banners
};

class LogParser {
public:
    virtual ~LogParser() = default;
    virtual TestStatusMap parse(const std::string& log) const = 0;
    virtual LogFormat format() const = 0;
};

// Ids are the "::"-separated parts after the file, joined with ".".
class PytestSummaryParser : public LogParser {
public:
    TestStatusMap parse(const std::string& log) const override;
    LogFormat format() const override { return LogFormat::PytestSummary; }
};

// Ids are full pytest node ids.
class PytestVerboseParser : public LogParser {
public:
    TestStatusMap parse(const std::string& log) const override;
    LogFormat format() const override { return LogFormat::PytestVerbose; }
};

class DjangoTestParser : public LogParser {
public:
    TestStatusMap parse(const std::string& log) const override;
    LogFormat format() const override { return LogFormat::Django; }
};

// Ids are bare test function names; banner failures keep "<path>.py:<name>".
class SympyTestParser : public LogParser {
public:
    TestStatusMap parse(const std::string& log) const override;
    LogFormat format() const override { return LogFormat::Sympy; }
};

// Repository name -> log format, shared by every session in the process.
class LogParserRegistry {
public:
    static LogParserRegistry& instance() {
        static LogParserRegistry instance;
        return instance;
    }

    void register_repo(const std::string& repo, LogFormat format);
    // Parser registered for `repo`, else the one for `fallback`.
    const LogParser& find(const std::string& repo, LogFormat fallback) const;
    const LogParser& get(LogFormat format) const;

private:
    LogParserRegistry();

    mutable std::mutex mtx_;
    std::map<std::string, LogFormat> repos_;
    PytestSummaryParser pytest_summary_;
    PytestVerboseParser pytest_verbose_;
    DjangoTestParser django_;
    SympyTestParser sympy_;
};

// "tests/test_a.py::TestA::test_b" -> "TestA.test_b"; ids without "::" are returned whole.
std::string dotted_test_id(const std::string& node_id);

// Removes colour escape sequences from every key.
TestStatusMap decolor_keys(const TestStatusMap& map);

}
