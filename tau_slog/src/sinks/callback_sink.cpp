#include "tau_slog/sinks/callback_sink.hpp"

namespace tau {
namespace slog {

CallbackSink::CallbackSink(Callback cb)
    : callback_(std::move(cb)) {}

void CallbackSink::Write(std::string_view line) {
    if (callback_) {
        callback_(line);
    }
}

void CallbackSink::Flush() {
}

} // namespace slog
} // namespace tau
