#include "line_dispatcher.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <exception>

LineDispatcher::LineDispatcher(std::string label, LineCallbacks callbacks)
    : label_(std::move(label)), callbacks_(std::move(callbacks)) {}

void LineDispatcher::dispatch(const std::string& line) {
    for (std::size_t i = 0; i < callbacks_.size(); i++) {
        if (!callbacks_[i]) continue;
        try {
            callbacks_[i](line);
        } catch (const std::exception& e) {
            report_failure(i, e.what());
        } catch (...) {
            report_failure(i, "non-standard exception");
        }
    }
}

void LineDispatcher::report_failure(std::size_t index, const std::string& what) {
    failures_++;
    linecap_log(fmt::format("{}: callback #{} failed: {}", label_, index, what));
}
