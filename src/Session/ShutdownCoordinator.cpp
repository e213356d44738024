#include "Session/ShutdownCoordinator.hpp"
#include "Capture/StopSignal.hpp"
#include "Recognition/IRecognitionStream.hpp"
#include "voice_search/debug_log.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace voice_search {

std::atomic<ShutdownCoordinator*> ShutdownCoordinator::s_active{nullptr};

ShutdownCoordinator::ShutdownCoordinator(StopSignal& stop)
    : _stop(stop)
    , _stream(nullptr)
    , _cancelled(false)
    , _interrupted(false)
    , _handlersInstalled(false) {
    static_assert(std::atomic<IRecognitionStream*>::is_always_lock_free,
                  "the signal handler reads the cancel target");
    std::memset(&_previousInt, 0, sizeof(_previousInt));
    std::memset(&_previousTerm, 0, sizeof(_previousTerm));
}

ShutdownCoordinator::~ShutdownCoordinator() {
    RestoreSignalHandlers();
}

void ShutdownCoordinator::SetCancelTarget(IRecognitionStream* stream) noexcept {
    _stream.store(stream);
}

void ShutdownCoordinator::CancelStream() noexcept {
    if (_cancelled.exchange(true)) {
        return;
    }
    IRecognitionStream* stream = _stream.load();
    if (stream) {
        stream->Cancel();
    }
}

void ShutdownCoordinator::RequestInterrupt() noexcept {
    _interrupted.store(true);
    CancelStream();
}

void ShutdownCoordinator::RequestStop() noexcept {
    _stop.Set();
}

void ShutdownCoordinator::HandleSignal(int /*signum*/) {
    ShutdownCoordinator* active = s_active.load();
    if (active) {
        active->RequestInterrupt();
    }
}

void ShutdownCoordinator::InstallSignalHandlers() {
    if (_handlersInstalled) {
        return;
    }

    ShutdownCoordinator* expected = nullptr;
    if (!s_active.compare_exchange_strong(expected, this)) {
        throw std::runtime_error("Signal handlers already owned by another session");
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &ShutdownCoordinator::HandleSignal;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, &_previousInt) != 0 ||
        sigaction(SIGTERM, &action, &_previousTerm) != 0) {
        int err = errno;
        (void)sigaction(SIGINT, &_previousInt, nullptr);
        s_active.store(nullptr);
        throw std::runtime_error(std::string("sigaction failed: ") + std::strerror(err));
    }

    _handlersInstalled = true;
    VOICE_SEARCH_DEBUG_LOG("Interrupt handlers installed" << VOICE_SEARCH_DEBUG_LOG_ENDL);
}

void ShutdownCoordinator::RestoreSignalHandlers() {
    if (!_handlersInstalled) {
        return;
    }

    (void)sigaction(SIGINT, &_previousInt, nullptr);
    (void)sigaction(SIGTERM, &_previousTerm, nullptr);
    _handlersInstalled = false;

    ShutdownCoordinator* expected = this;
    s_active.compare_exchange_strong(expected, nullptr);
}

} // namespace voice_search
