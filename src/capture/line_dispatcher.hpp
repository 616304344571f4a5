#pragma once

#include <cstddef>
#include <string>
#include <core/types.hpp>

// Fans a finalized line out to every registered callback, in registration
// order. A callback that throws is logged and skipped; the remaining
// callbacks still run and the caller never sees the exception.
class LineDispatcher {
public:
    LineDispatcher(std::string label, LineCallbacks callbacks);

    void dispatch(const std::string& line);

    std::size_t callback_count() const { return callbacks_.size(); }
    // Callback invocations that threw.
    std::size_t failures() const { return failures_; }

private:
    void report_failure(std::size_t index, const std::string& what);

    std::string label_;
    LineCallbacks callbacks_;
    std::size_t failures_ = 0;
};
