#include "capture.hpp"

#include <algorithm>

#include "../dlid/designators.hpp"
#include "../logger.hpp"

namespace app {
namespace capture {

namespace {
// '@', three separators, "ANSI ", iin, two versions, entry count
constexpr std::size_t HEADER_SIZE = 21;
constexpr std::size_t PARSING_DLID_THRESHOLD = 4;
} // namespace

std::size_t payload_end(const dlid::ParseResult& result) {
    std::size_t end = HEADER_SIZE + result.subfile_designators.size() * dlid::SUBFILE_DESIGNATOR_SIZE;
    for (const auto& sd : result.subfile_designators) {
        end = std::max(end, static_cast<std::size_t>(sd.offset) + static_cast<std::size_t>(sd.length));
    }
    return end;
}

Session::Session(std::string initial, std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    state_.value = std::move(initial);
}

std::size_t Session::subscribe(Listener cb) {
    const std::size_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(cb));
    return id;
}

void Session::unsubscribe(std::size_t id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const auto& l) { return l.first == id; }),
                     listeners_.end());
}

void Session::notify() {
    // Copy so a listener may unsubscribe itself.
    auto ls = listeners_;
    for (auto& l : ls) l.second(state_);
}

void Session::start_capturing(Clock::time_point now) {
    // the '@' moves from the field into the parser
    state_.value.pop_back();
    parser_ = std::make_unique<dlid::Parser>("@");
    state_.is_capturing = true;
    state_.is_parsing_dlid = false;
    state_.result.reset();
    reset_timeout(now);
    notify();
}

void Session::cancel_capturing() {
    deadline_.reset();
    if (!state_.is_capturing) return;
    if (parser_) {
        state_.value += parser_->data();
    }
    parser_.reset();
    state_.is_capturing = false;
    state_.is_parsing_dlid = false;
    state_.result.reset();
    logger::info("Capture cancelled");
    notify();
}

void Session::complete_capturing(Clock::time_point now) {
    deadline_.reset();
    const dlid::ParseResult& res = parser_->result();
    const std::string data = parser_->data();
    const std::size_t end = payload_end(res);

    state_.result = res;
    state_.is_capturing = false;
    state_.is_parsing_dlid = false;
    parser_.reset();
    logger::info("Capture complete: " + std::to_string(end) + " chars");
    notify();

    // Input that arrived in the same chunk after the payload is ordinary typing.
    if (end < data.size()) {
        append(data.substr(end), now);
    }
}

void Session::append(const std::string& text, Clock::time_point now) {
    if (text.empty()) return;

    if (!state_.is_capturing) {
        // Feed up to and including the next '@', then switch to capturing.
        const std::size_t at = text.find('@');
        if (at == std::string::npos) {
            state_.value += text;
            notify();
            return;
        }
        state_.value += text.substr(0, at + 1);
        notify();
        start_capturing(now);
        append(text.substr(at + 1), now);
        return;
    }

    const bool awaiting = parser_->append(text);
    if (parser_->is_complete()) {
        complete_capturing(now);
    } else if (parser_->error_kind() == dlid::ErrorKind::Header) {
        // not a DL/ID header, give the text back
        cancel_capturing();
    } else if (parser_->error_kind() == dlid::ErrorKind::Structure) {
        reset_timeout(now);
    } else if (awaiting) {
        reset_timeout(now);
        if (parser_->data().size() >= PARSING_DLID_THRESHOLD && !state_.is_parsing_dlid) {
            state_.is_parsing_dlid = true;
            notify();
        }
    }
}

void Session::set_value(const std::string& v, Clock::time_point now) {
    if (v.compare(0, state_.value.size(), state_.value) == 0 && v.size() >= state_.value.size()) {
        append(v.substr(state_.value.size()), now);
    } else {
        state_.value.clear();
        notify();
        append(v, now);
    }
}

void Session::tick(Clock::time_point now) {
    if (deadline_ && now >= *deadline_) {
        logger::warn("Capture timed out");
        cancel_capturing();
    }
}

} // namespace capture
} // namespace app
