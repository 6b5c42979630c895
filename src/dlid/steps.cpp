#include "steps.hpp"

#include <utility>

#include "errors.hpp"

namespace dlid {

StepEngine::StepEngine(std::vector<Step> steps)
    : queue_(steps.begin(), steps.end()) {}

const ParseResult& StepEngine::run() {
    if (error_) {
        std::rethrow_exception(error_);
    }
    while (!queue_.empty()) {
        StepResult res;
        try {
            res = queue_.front()(result_);
        } catch (const InsufficientData&) {
            throw;
        } catch (const ParseError&) {
            error_ = std::current_exception();
            queue_.clear();
            throw;
        }
        result_ = std::move(res.result);
        queue_.pop_front();
        queue_.insert(queue_.begin(),
                      std::make_move_iterator(res.next.begin()),
                      std::make_move_iterator(res.next.end()));
    }
    return result_;
}

} // namespace dlid
