#pragma once

#include "trialbox/execution_result.hh"
#include "trialbox/test_result.hh"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trialbox {

struct Attempt {
    int iteration = 1; // >= 1
    std::string code;
    bool success = false;
    std::string output;
    std::string error;
    std::optional<TestResult> test_results;
    std::string timestamp; // ISO-8601 UTC with microseconds, e.g. "2024-05-01T12:00:00.000042Z"

    bool operator==(const Attempt&) const = default;

    // Timestamp is set to the current time
    [[nodiscard]] static Attempt
    from_result(int iteration, std::string code, const ExecutionResult& er);
};

[[nodiscard]] std::string current_timestamp();

enum class Pattern : uint8_t {
    SameError, // the last two attempts failed with the same first line of the error
    SameTestFailure, // a test failed in both of the last two attempts
    NoProgress, // the last three attempts failed without any passing test
};

[[nodiscard]] std::string_view to_string(Pattern pattern) noexcept;

enum class Progress : uint8_t {
    InsufficientData,
    Improving,
    Regressing,
    Mixed,
    Stable,
};

[[nodiscard]] std::string_view to_string(Progress progress) noexcept;

struct MemorySummary {
    size_t total_attempts = 0;
    size_t successful_attempts = 0;
    size_t failed_attempts = 0;
    std::optional<std::string> most_recent_error; // unset if the last attempt succeeded
    Progress progress = Progress::InsufficientData;

    bool operator==(const MemorySummary&) const = default;
};

// Bounded history of the most recent attempts, the oldest attempt is evicted first
class ShortTermMemory {
    size_t max_size_;
    std::deque<Attempt> attempts_; // oldest first

public:
    static constexpr size_t default_max_size = 5;

    // Throws std::invalid_argument if @p max_size is 0
    explicit ShortTermMemory(size_t max_size = default_max_size);

    // Fills the timestamp if it is empty
    void add(Attempt attempt);

    [[nodiscard]] std::vector<Attempt> get_all() const;

    // Returns at most @p n most recent attempts, oldest first
    [[nodiscard]] std::vector<Attempt> get_recent(size_t n) const;

    [[nodiscard]] size_t count() const noexcept { return attempts_.size(); }

    [[nodiscard]] size_t max_size() const noexcept { return max_size_; }

    void clear() noexcept { attempts_.clear(); }

    [[nodiscard]] bool has_pattern(Pattern pattern) const;

    [[nodiscard]] MemorySummary get_summary() const;

    // Serializes the attempts as a JSON array
    [[nodiscard]] std::string to_json() const;

    // Replaces the attempts with the ones serialized by to_json(), keeping the newest max_size()
    // ones. Throws MemoryFormatError on malformed input, the memory is left unchanged then.
    void from_json(std::string_view json);

private:
    [[nodiscard]] Progress progress() const;
};

} // namespace trialbox
