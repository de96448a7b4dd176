#include "trialbox/attempt_memory.hh"
#include "trialbox/concat_tostr.hh"
#include "trialbox/errors.hh"
#include "trialbox/macros/throw.hh"
#include "trialbox/string_transform.hh"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <set>
#include <stdexcept>

using rapidjson::SizeType;
using rapidjson::Value;
using std::string;
using std::string_view;

namespace {

using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(Writer& writer, string_view str) {
    writer.String(str.data(), static_cast<SizeType>(str.size()));
}

void write_test_result(Writer& writer, const trialbox::TestResult& tr) {
    writer.StartObject();
    writer.Key("total_tests");
    writer.Int(tr.total_tests);
    writer.Key("passed");
    writer.Int(tr.passed);
    writer.Key("failed");
    writer.Int(tr.failed);
    writer.Key("errors");
    writer.Int(tr.errors);
    writer.Key("failures");
    writer.StartArray();
    for (const auto& failure : tr.failures) {
        writer.StartObject();
        writer.Key("test_name");
        write_string(writer, failure.test_name);
        writer.Key("error_kind");
        write_string(writer, failure.error_kind);
        writer.Key("message");
        write_string(writer, failure.message);
        writer.Key("full_diagnostic");
        write_string(writer, failure.full_diagnostic);
        writer.EndObject();
    }
    writer.EndArray();
    writer.Key("success");
    writer.Bool(tr.success);
    writer.EndObject();
}

const Value& member(const Value& obj, const char* name, string_view where) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        THROW_AS(trialbox::MemoryFormatError, where, ": missing member \"", name, '"');
    }
    return it->value;
}

string get_string(const Value& obj, const char* name, string_view where) {
    const auto& val = member(obj, name, where);
    if (not val.IsString()) {
        THROW_AS(trialbox::MemoryFormatError, where, ": \"", name, "\" is not a string");
    }
    return {val.GetString(), val.GetStringLength()};
}

int get_int(const Value& obj, const char* name, string_view where) {
    const auto& val = member(obj, name, where);
    if (not val.IsInt() or val.GetInt() < 0) {
        THROW_AS(
            trialbox::MemoryFormatError, where, ": \"", name, "\" is not a non-negative integer");
    }
    return val.GetInt();
}

bool get_bool(const Value& obj, const char* name, string_view where) {
    const auto& val = member(obj, name, where);
    if (not val.IsBool()) {
        THROW_AS(trialbox::MemoryFormatError, where, ": \"", name, "\" is not a boolean");
    }
    return val.GetBool();
}

trialbox::TestResult read_test_result(const Value& val, const string& where) {
    if (not val.IsObject()) {
        THROW_AS(trialbox::MemoryFormatError, where, " is not an object");
    }
    trialbox::TestResult tr;
    tr.total_tests = get_int(val, "total_tests", where);
    tr.passed = get_int(val, "passed", where);
    tr.failed = get_int(val, "failed", where);
    tr.errors = get_int(val, "errors", where);
    tr.success = get_bool(val, "success", where);
    const auto& failures = member(val, "failures", where);
    if (not failures.IsArray()) {
        THROW_AS(trialbox::MemoryFormatError, where, ": \"failures\" is not an array");
    }
    for (SizeType i = 0; i < failures.Size(); ++i) {
        const auto& failure = failures[i];
        auto failure_where = concat_tostr(where, ".failures[", i, ']');
        if (not failure.IsObject()) {
            THROW_AS(trialbox::MemoryFormatError, failure_where, " is not an object");
        }
        tr.failures.push_back({
            .test_name = get_string(failure, "test_name", failure_where),
            .error_kind = get_string(failure, "error_kind", failure_where),
            .message = get_string(failure, "message", failure_where),
            .full_diagnostic = get_string(failure, "full_diagnostic", failure_where),
        });
    }
    return tr;
}

trialbox::Attempt read_attempt(const Value& val, const string& where) {
    if (not val.IsObject()) {
        THROW_AS(trialbox::MemoryFormatError, where, " is not an object");
    }
    trialbox::Attempt attempt;
    attempt.iteration = get_int(val, "iteration", where);
    if (attempt.iteration < 1) {
        THROW_AS(trialbox::MemoryFormatError, where, ": \"iteration\" has to be positive");
    }
    attempt.code = get_string(val, "code", where);
    attempt.success = get_bool(val, "success", where);
    attempt.output = get_string(val, "output", where);
    attempt.error = get_string(val, "error", where);
    attempt.timestamp = get_string(val, "timestamp", where);
    auto it = val.FindMember("test_results");
    if (it != val.MemberEnd() and not it->value.IsNull()) {
        attempt.test_results = read_test_result(it->value, concat_tostr(where, ".test_results"));
    }
    return attempt;
}

std::set<string_view> failing_tests(const trialbox::TestResult& tr) {
    std::set<string_view> names;
    for (const auto& failure : tr.failures) {
        names.emplace(failure.test_name);
    }
    return names;
}

} // namespace

namespace trialbox {

Attempt Attempt::from_result(int iteration, string code, const ExecutionResult& er) {
    return {
        .iteration = iteration,
        .code = std::move(code),
        .success = er.success,
        .output = er.output,
        .error = er.error,
        .test_results = er.test_result,
        .timestamp = current_timestamp(),
    };
}

string current_timestamp() {
    using std::chrono::system_clock;
    auto now = system_clock::now();
    auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch());
    auto secs = static_cast<time_t>(usecs.count() / 1'000'000);
    tm t{};
    if (gmtime_r(&secs, &t) == nullptr) {
        THROW("gmtime_r() failed");
    }
    char buff[64];
    size_t len = strftime(buff, sizeof(buff), "%Y-%m-%dT%H:%M:%S", &t);
    std::snprintf(
        buff + len, sizeof(buff) - len, ".%06lldZ",
        static_cast<long long>(usecs.count() % 1'000'000));
    return buff;
}

string_view to_string(Pattern pattern) noexcept {
    switch (pattern) {
    case Pattern::SameError: return "same_error";
    case Pattern::SameTestFailure: return "same_test_failure";
    case Pattern::NoProgress: return "no_progress";
    }
    return "unknown";
}

string_view to_string(Progress progress) noexcept {
    switch (progress) {
    case Progress::InsufficientData: return "insufficient_data";
    case Progress::Improving: return "improving";
    case Progress::Regressing: return "regressing";
    case Progress::Mixed: return "mixed";
    case Progress::Stable: return "stable";
    }
    return "unknown";
}

ShortTermMemory::ShortTermMemory(size_t max_size)
: max_size_{max_size} {
    if (max_size_ == 0) {
        throw std::invalid_argument("memory size has to be positive");
    }
}

void ShortTermMemory::add(Attempt attempt) {
    if (attempt.timestamp.empty()) {
        attempt.timestamp = current_timestamp();
    }
    attempts_.emplace_back(std::move(attempt));
    if (attempts_.size() > max_size_) {
        attempts_.pop_front();
    }
}

std::vector<Attempt> ShortTermMemory::get_all() const {
    return {attempts_.begin(), attempts_.end()};
}

std::vector<Attempt> ShortTermMemory::get_recent(size_t n) const {
    n = std::min(n, attempts_.size());
    return {attempts_.end() - static_cast<ptrdiff_t>(n), attempts_.end()};
}

bool ShortTermMemory::has_pattern(Pattern pattern) const {
    auto size = attempts_.size();
    switch (pattern) {
    case Pattern::SameError: {
        if (size < 2) {
            return false;
        }
        const auto& prev = attempts_[size - 2];
        const auto& last = attempts_[size - 1];
        return not prev.success and not last.success and
            first_line(prev.error) == first_line(last.error);
    }
    case Pattern::SameTestFailure: {
        if (size < 2) {
            return false;
        }
        const auto& prev = attempts_[size - 2];
        const auto& last = attempts_[size - 1];
        if (not prev.test_results or not last.test_results) {
            return false;
        }
        auto prev_failing = failing_tests(*prev.test_results);
        auto last_failing = failing_tests(*last.test_results);
        return std::any_of(last_failing.begin(), last_failing.end(), [&](string_view name) {
            return prev_failing.contains(name);
        });
    }
    case Pattern::NoProgress: {
        if (size < 3) {
            return false;
        }
        return std::none_of(attempts_.end() - 3, attempts_.end(), [](const Attempt& attempt) {
            return attempt.success or (attempt.test_results and attempt.test_results->passed > 0);
        });
    }
    }
    return false;
}

Progress ShortTermMemory::progress() const {
    if (attempts_.size() < 2) {
        return Progress::InsufficientData;
    }
    auto recent = get_recent(3);
    bool all_tested = std::all_of(recent.begin(), recent.end(), [](const Attempt& attempt) {
        return attempt.test_results.has_value();
    });
    if (all_tested) {
        auto passed = [](const Attempt& attempt) { return attempt.test_results->passed; };
        bool non_decreasing = true;
        bool non_increasing = true;
        for (size_t i = 1; i < recent.size(); ++i) {
            non_decreasing = non_decreasing and passed(recent[i - 1]) <= passed(recent[i]);
            non_increasing = non_increasing and passed(recent[i - 1]) >= passed(recent[i]);
        }
        if (non_decreasing) {
            return Progress::Improving;
        }
        if (non_increasing) {
            return Progress::Regressing;
        }
    }
    bool execution_errors = std::any_of(recent.begin(), recent.end(), [](const Attempt& attempt) {
        return not attempt.success and not attempt.test_results;
    });
    bool test_failures = std::any_of(recent.begin(), recent.end(), [](const Attempt& attempt) {
        return not attempt.success and attempt.test_results;
    });
    if (execution_errors and test_failures) {
        return Progress::Mixed;
    }
    return Progress::Stable;
}

MemorySummary ShortTermMemory::get_summary() const {
    MemorySummary summary;
    summary.total_attempts = attempts_.size();
    summary.successful_attempts = static_cast<size_t>(std::count_if(
        attempts_.begin(), attempts_.end(), [](const Attempt& attempt) { return attempt.success; }
    ));
    summary.failed_attempts = summary.total_attempts - summary.successful_attempts;
    if (not attempts_.empty() and not attempts_.back().success) {
        summary.most_recent_error = attempts_.back().error;
    }
    summary.progress = progress();
    return summary;
}

string ShortTermMemory::to_json() const {
    rapidjson::StringBuffer buff;
    Writer writer{buff};
    writer.SetIndent(' ', 2);
    writer.StartArray();
    for (const auto& attempt : attempts_) {
        writer.StartObject();
        writer.Key("iteration");
        writer.Int(attempt.iteration);
        writer.Key("code");
        write_string(writer, attempt.code);
        writer.Key("success");
        writer.Bool(attempt.success);
        writer.Key("output");
        write_string(writer, attempt.output);
        writer.Key("error");
        write_string(writer, attempt.error);
        writer.Key("test_results");
        if (attempt.test_results) {
            write_test_result(writer, *attempt.test_results);
        } else {
            writer.Null();
        }
        writer.Key("timestamp");
        write_string(writer, attempt.timestamp);
        writer.EndObject();
    }
    writer.EndArray();
    return {buff.GetString(), buff.GetSize()};
}

void ShortTermMemory::from_json(string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        THROW_AS(
            MemoryFormatError, "invalid JSON at offset ", doc.GetErrorOffset(), ": ",
            rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (not doc.IsArray()) {
        THROW_AS(MemoryFormatError, "expected an array of attempts");
    }
    std::deque<Attempt> attempts;
    for (SizeType i = 0; i < doc.Size(); ++i) {
        attempts.emplace_back(read_attempt(doc[i], concat_tostr("attempts[", i, ']')));
        if (attempts.size() > max_size_) {
            attempts.pop_front();
        }
    }
    attempts_ = std::move(attempts);
}

} // namespace trialbox
