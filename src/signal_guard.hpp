#pragma once

#include <csignal>

namespace procpeek {

// Installs a signal handler for its lifetime and puts the previous one back
class SignalHandlerGuard {
public:
    using Handler = void (*)(int);

    SignalHandlerGuard(int signum, Handler handler)
        : signum_(signum)
        , previous_(std::signal(signum, handler))
        , active_(previous_ != SIG_ERR) {}

    ~SignalHandlerGuard() {
        if (active_) std::signal(signum_, previous_);
    }

    SignalHandlerGuard(const SignalHandlerGuard&) = delete;
    SignalHandlerGuard& operator=(const SignalHandlerGuard&) = delete;

    [[nodiscard]] bool active() const { return active_; }

private:
    int signum_;
    Handler previous_;
    bool active_;
};

} // namespace procpeek
