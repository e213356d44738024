#include "Speech/CommandSpeechOutput.hpp"
#include "voice_search/debug_log.hpp"

#include <pthread.h>
#include <signal.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>

namespace voice_search {

namespace {

// Keeps SIGPIPE from a dead synthesizer on this thread and discards it,
// so the write fails with EPIPE instead of killing the process.
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigemptyset(&_pipeSet);
        sigaddset(&_pipeSet, SIGPIPE);
        _blocked = pthread_sigmask(SIG_BLOCK, &_pipeSet, &_previousSet) == 0;

        sigset_t pending;
        sigemptyset(&pending);
        _alreadyPending = sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
    }

    ~ScopedSigpipeBlock() {
        if (!_blocked) {
            return;
        }
        if (!_alreadyPending) {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&_pipeSet, nullptr, &zero) == -1 && errno == EINTR) {
            }
        }
        (void)pthread_sigmask(SIG_SETMASK, &_previousSet, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

private:
    sigset_t _pipeSet;
    sigset_t _previousSet;
    bool _blocked;
    bool _alreadyPending;
};

} // namespace

CommandSpeechOutput::CommandSpeechOutput(const std::string& command)
    : _command(command) {
}

void CommandSpeechOutput::Say(const std::string& text) {
    if (text.empty()) {
        return;
    }

    ScopedSigpipeBlock sigpipeBlock;

    FILE* pipe = popen(_command.c_str(), "w");
    if (!pipe) {
        std::cerr << "Could not start speech command: " << _command << std::endl;
        return;
    }

    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    int writeError = 0;
    if (written != text.size() || fflush(pipe) != 0) {
        writeError = errno;
    }
    int status = pclose(pipe);

    if (writeError != 0) {
        std::cerr << "Speech command did not take the text: " << std::strerror(writeError) << std::endl;
    }
    if (status != 0) {
        std::cerr << "Speech command exited with status " << status << std::endl;
    }
    VOICE_SEARCH_DEBUG_LOG("Spoke " << written << " bytes" << VOICE_SEARCH_DEBUG_LOG_ENDL);
}

} // namespace voice_search
