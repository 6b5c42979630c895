#pragma once
// Purpose: Keyboard-wedge capture session built on the DL/ID parser.
//
// Text typed into a field is collected in State::value until an '@' shows up; from then on
// characters are diverted into a parser. The capture ends when:
// - the parser completes (State::result is set),
// - the header turns out not to be DL/ID (swallowed text is handed back to value),
// - no input arrives before the idle deadline (tick(); swallowed text handed back).
// A structural error after a valid header keeps swallowing input until the deadline, so the
// rest of a bad scan does not spill into the field.
// Time is passed in explicitly; the session owns no timers.

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../dlid/parser.hpp"

namespace app {
namespace capture {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{200};

struct State {
    std::string value;
    bool is_capturing = false;
    bool is_parsing_dlid = false;  // at least the '@' and separators have arrived
    std::optional<dlid::ParseResult> result;
};

class Session {
public:
    using Listener = std::function<void(const State&)>;

    explicit Session(std::string initial = {}, std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    void append(const std::string& text, Clock::time_point now);

    // Replace the field contents; a pure extension is treated as typed input.
    void set_value(const std::string& v, Clock::time_point now);

    // Cancels an in-progress capture once its idle deadline has passed.
    void tick(Clock::time_point now);

    const State& state() const { return state_; }
    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

    std::size_t subscribe(Listener cb);
    void unsubscribe(std::size_t id);

private:
    void start_capturing(Clock::time_point now);
    void cancel_capturing();
    void complete_capturing(Clock::time_point now);
    void reset_timeout(Clock::time_point now) { deadline_ = now + timeout_; }
    void notify();

    std::chrono::milliseconds timeout_;
    std::unique_ptr<dlid::Parser> parser_;
    State state_;
    std::optional<Clock::time_point> deadline_;
    std::vector<std::pair<std::size_t, Listener>> listeners_;
    std::size_t next_listener_id_ = 1;
};

// Index one past the last payload character: the end of the directory or of the furthest
// declared subfile, whichever is later.
std::size_t payload_end(const dlid::ParseResult& result);

} // namespace capture
} // namespace app
