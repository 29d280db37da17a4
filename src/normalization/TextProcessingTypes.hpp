#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace normalization {

// Outcome of one pipeline pass. On failure `result` is left default-constructed
// and the caller keeps the text it fed into the pass.
template<typename T>
struct StageResult {
    T result{};
    bool succeeded = true;
    std::optional<std::string> error;
    std::chrono::microseconds duration{0};
    std::string stage_name;

    static StageResult success(T value, std::chrono::microseconds elapsed, const std::string& name) {
        StageResult res;
        res.result = std::move(value);
        res.duration = elapsed;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& reason, std::chrono::microseconds elapsed, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = reason;
        res.duration = elapsed;
        res.stage_name = name;
        return res;
    }
};

} // namespace normalization
