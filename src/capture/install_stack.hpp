#pragma once

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

constexpr const char* ERR_ALREADY_ACTIVE = "usage: capture is already installed and active";
constexpr const char* ERR_NOT_INSTALLED  = "usage: uninstall() without a matching install()";

// InstallStack: the captures currently installed on one stream.
//
// The last entry is the active capture; it alone receives the stream's bytes.
// Entries below it are superseded but keep their state, and become active
// again when everything above them is uninstalled or when they are
// re-installed (which moves them back to the top).
//
// The stack does not lock itself. Owners hold mutex() around every call,
// together with whatever stream state they swap in step with the stack.
template <typename T>
class InstallStack {
public:
    std::mutex& mutex() { return mutex_; }

    bool empty() const { return entries_.empty(); }
    std::size_t depth() const { return entries_.size(); }

    T* active() const { return entries_.empty() ? nullptr : entries_.back(); }

    bool contains(const T* entry) const {
        return std::find(entries_.begin(), entries_.end(), entry) != entries_.end();
    }

    // Make `entry` active. Fails if it already is.
    Result<void> push(T* entry) {
        if (active() == entry)
            return Result<void>::Err(ERR_ALREADY_ACTIVE);
        erase(entry);
        entries_.push_back(entry);
        return Result<void>::Ok();
    }

    // Take `entry` out of the stack wherever it sits. Fails if it is absent.
    Result<void> remove(T* entry) {
        if (!contains(entry))
            return Result<void>::Err(ERR_NOT_INSTALLED);
        erase(entry);
        return Result<void>::Ok();
    }

private:
    void erase(T* entry) {
        entries_.erase(std::remove(entries_.begin(), entries_.end(), entry), entries_.end());
    }

    std::mutex mutex_;
    std::vector<T*> entries_;
};
