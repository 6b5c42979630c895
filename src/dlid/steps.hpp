#pragma once
// Purpose: Resumable step queue driving the DL/ID parse.
//
// Notes:
// - A step maps the committed result to a new result plus follow-up steps, which replace it at
//   the front of the queue in order.
// - A step that throws InsufficientData stays queued and the committed result is untouched, so
//   the next run() re-executes it from scratch against the same reader cursor.
// - Any other error puts the engine in a terminal failed state; later run() calls rethrow it.

#include <deque>
#include <exception>
#include <functional>
#include <vector>

#include "types.hpp"

namespace dlid {

struct StepResult;

using Step = std::function<StepResult(const ParseResult&)>;

struct StepResult {
    ParseResult result;
    std::vector<Step> next;
};

class StepEngine {
public:
    explicit StepEngine(std::vector<Step> steps);

    // Drives the queue until it is empty or a step throws.
    // Returns the final result; throws InsufficientData/ParseError otherwise.
    const ParseResult& run();

    bool done() const { return queue_.empty() && !failed(); }
    bool failed() const { return static_cast<bool>(error_); }
    std::size_t pending() const { return queue_.size(); }

private:
    std::deque<Step> queue_;
    ParseResult result_;
    std::exception_ptr error_;
};

} // namespace dlid
