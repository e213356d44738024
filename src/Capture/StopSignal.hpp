#pragma once

#include <atomic>

namespace voice_search {

// Set-once cancellation flag shared by the capture thread and the main thread.
class StopSignal {
public:
    StopSignal() : _set(false) {}

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    // Returns true only for the call that actually flipped the flag.
    bool Set() noexcept { return !_set.exchange(true); }

    bool IsSet() const noexcept { return _set.load(); }

private:
    std::atomic<bool> _set;
};

} // namespace voice_search
