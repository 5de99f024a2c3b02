#include "grading/LogParser.hpp"
#include "utils/OutputScrubber.hpp"
#include "constants.hpp"
#include <sstream>
#include <vector>

namespace evalbox {

namespace {

const char* const STATUSES[] = {STATUS_FAILED, STATUS_PASSED, STATUS_SKIPPED, STATUS_ERROR, STATUS_XFAIL};

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    return s.substr(begin, s.find_last_not_of(ws) - begin + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream in(s);
    std::string part;
    while (in >> part) parts.push_back(part);
    return parts;
}

// "a/b.py::Cls::test_x - msg" -> "Cls.test_x - msg"
std::string join_after_file(const std::string& line) {
    std::string out;
    size_t pos = line.find("::");
    while (pos != std::string::npos) {
        size_t next = line.find("::", pos + 2);
        std::string part = line.substr(pos + 2, next == std::string::npos ? std::string::npos : next - pos - 2);
        if (!out.empty()) out += ".";
        out += part;
        pos = next;
    }
    return out;
}

std::string cut_at_dash(const std::string& s) {
    auto pos = s.find(" - ");
    return pos == std::string::npos ? s : s.substr(0, pos);
}

} // namespace

TestStatusMap PytestSummaryParser::parse(const std::string& log) const {
    TestStatusMap result;
    const std::string marker = "short test summary info";
    auto pos = log.find(marker);
    if (pos == std::string::npos) return result;

    for (const auto& raw : split_lines(trim(log.substr(pos + marker.size())))) {
        std::string line = trim(raw);
        if (line.find("::") == std::string::npos) continue;
        if (line.find(STATUS_PASSED) != std::string::npos) {
            result[join_after_file(line)] = STATUS_PASSED;
        } else if (line.find(STATUS_FAILED) != std::string::npos) {
            result[cut_at_dash(join_after_file(line))] = STATUS_FAILED;
        } else if (line.find(STATUS_ERROR) != std::string::npos) {
            result[cut_at_dash(join_after_file(line))] = STATUS_ERROR;
        } else if (line.find(STATUS_SKIPPED) != std::string::npos) {
            result[cut_at_dash(join_after_file(line))] = STATUS_SKIPPED;
        }
    }
    return result;
}

TestStatusMap PytestVerboseParser::parse(const std::string& log) const {
    TestStatusMap result;
    for (const auto& raw : split_lines(log)) {
        std::string line = trim(raw);
        bool matched = false;
        for (const char* status : STATUSES) {
            if (!starts_with(line, status)) continue;
            // "FAILED test_x - AssertionError" -> "FAILED test_x AssertionError"
            if (starts_with(line, STATUS_FAILED)) {
                size_t p;
                while ((p = line.find(" - ")) != std::string::npos) line.replace(p, 3, " ");
            }
            auto parts = split_ws(line);
            if (parts.size() > 1 && parts[0] == status) result[parts[1]] = status;
            matched = true;
            break;
        }
        if (matched) continue;

        // "tests/test_x.py::test_a PASSED [ 50%]"
        auto parts = split_ws(line);
        if (parts.size() >= 2 && parts[0].find("::") != std::string::npos) {
            for (const char* status : STATUSES) {
                if (parts[1] == status) {
                    result[parts[0]] = status;
                    break;
                }
            }
        }
    }
    return result;
}

TestStatusMap DjangoTestParser::parse(const std::string& log) const {
    TestStatusMap result;
    for (const auto& raw : split_lines(log)) {
        std::string line = trim(raw);
        auto dots = line.find(" ... ");
        if (dots != std::string::npos) {
            std::string test = line.substr(0, dots);
            std::string verdict = trim(line.substr(dots + 5));
            if (verdict == "ok" || verdict == "OK") result[test] = STATUS_PASSED;
            else if (starts_with(verdict, "skipped")) result[test] = STATUS_SKIPPED;
            else if (verdict == "FAIL") result[test] = STATUS_FAILED;
            else if (verdict == "ERROR") result[test] = STATUS_ERROR;
            else if (verdict == "expected failure") result[test] = STATUS_XFAIL;
            continue;
        }
        if (starts_with(line, "FAIL:") || starts_with(line, "ERROR:")) {
            auto parts = split_ws(line);
            // "FAIL: test_x (module.Class)"
            if (parts.size() >= 3) {
                std::string test = parts[1] + " " + parts[2];
                result[test] = starts_with(line, "FAIL:") ? STATUS_FAILED : STATUS_ERROR;
            }
        }
    }
    return result;
}

TestStatusMap SympyTestParser::parse(const std::string& log) const {
    TestStatusMap result;
    for (const auto& raw : split_lines(log)) {
        std::string line = trim(raw);

        // "____ sympy/core/tests/test_basic.py:test_equality ____"
        if (line.size() > 2 && line.front() == '_' && line.back() == '_') {
            auto first = line.find_first_not_of('_');
            if (first == std::string::npos) continue;
            auto last = line.find_last_not_of('_');
            std::string inner = trim(line.substr(first, last - first + 1));
            if (inner.find(".py:") != std::string::npos && inner.find(' ') == std::string::npos) {
                result[inner] = STATUS_FAILED;
            }
            continue;
        }

        // "test_equality ok", "test_sympify F", "test_lambdify E"
        if (!starts_with(line, "test_")) continue;
        auto parts = split_ws(line);
        if (parts.size() < 2) continue;
        const std::string& verdict = parts.back();
        if (verdict == "ok") result[parts[0]] = STATUS_PASSED;
        else if (verdict == "F") result[parts[0]] = STATUS_FAILED;
        else if (verdict == "E") result[parts[0]] = STATUS_ERROR;
    }
    return result;
}

LogParserRegistry::LogParserRegistry() {
    repos_["django/django"] = LogFormat::Django;
    repos_["sympy/sympy"] = LogFormat::Sympy;
}

void LogParserRegistry::register_repo(const std::string& repo, LogFormat format) {
    std::lock_guard<std::mutex> lock(mtx_);
    repos_[repo] = format;
}

const LogParser& LogParserRegistry::find(const std::string& repo, LogFormat fallback) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = repos_.find(repo);
    return get(it == repos_.end() ? fallback : it->second);
}

const LogParser& LogParserRegistry::get(LogFormat format) const {
    switch (format) {
        case LogFormat::PytestSummary: return pytest_summary_;
        case LogFormat::PytestVerbose: return pytest_verbose_;
        case LogFormat::Django: return django_;
        case LogFormat::Sympy: return sympy_;
    }
    return pytest_summary_;
}

std::string dotted_test_id(const std::string& node_id) {
    if (node_id.find("::") == std::string::npos) return node_id;
    return join_after_file(node_id);
}

TestStatusMap decolor_keys(const TestStatusMap& map) {
    TestStatusMap out;
    for (const auto& [key, status] : map) out[strip_ansi(key)] = status;
    return out;
}

}
