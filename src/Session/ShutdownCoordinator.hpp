#pragma once

#include <signal.h>

#include <atomic>

namespace voice_search {

class IRecognitionStream;
class StopSignal;

// Single place where a session is told to end. Capture is stopped
// cooperatively through the StopSignal; the network stream is cancelled
// through the stream's own Cancel(), called at most once, also when it is
// triggered from SIGINT/SIGTERM.
class ShutdownCoordinator {
public:
    explicit ShutdownCoordinator(StopSignal& stop);
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    // Must be set before InstallSignalHandlers(). The stream's Cancel() has
    // to be async-signal-safe. The stream must outlive the coordinator or be
    // cleared with nullptr first.
    void SetCancelTarget(IRecognitionStream* stream) noexcept;

    // Cancels the stream once; later calls do nothing.
    void CancelStream() noexcept;

    // Interrupt path: what the signal handler does.
    void RequestInterrupt() noexcept;

    // Voice path: stops capture.
    void RequestStop() noexcept;

    bool WasInterrupted() const { return _interrupted.load(); }
    bool WasCancelled() const { return _cancelled.load(); }

    // Only one coordinator may own the handlers at a time.
    // Throws std::runtime_error if another one does.
    void InstallSignalHandlers();
    void RestoreSignalHandlers();

private:
    static void HandleSignal(int signum);

    static std::atomic<ShutdownCoordinator*> s_active;

    StopSignal& _stop;
    std::atomic<IRecognitionStream*> _stream;
    std::atomic<bool> _cancelled;
    std::atomic<bool> _interrupted;
    bool _handlersInstalled;
    struct sigaction _previousInt;
    struct sigaction _previousTerm;
};

} // namespace voice_search
