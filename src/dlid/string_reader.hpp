#pragma once
// Purpose: Growable string buffer with a read cursor.
// Characters are never removed; only the cursor moves, so absolute offsets stay valid while
// more data is appended.

#include <string>
#include <cstddef>
#include <utility>

#include "errors.hpp"

namespace dlid {

class StringReader {
public:
    explicit StringReader(std::string data = {}, std::size_t pos = 0)
        : data_(std::move(data)), pos_(pos) {}

    // Unread characters; zero when the cursor sits past the end.
    std::size_t remaining() const {
        return pos_ < data_.size() ? data_.size() - pos_ : 0;
    }

    std::string peek(std::size_t n) const {
        if (n > remaining()) {
            throw InsufficientData();
        }
        if (n == 0) return {};
        return data_.substr(pos_, n);
    }

    std::string read(std::size_t n) {
        std::string res = peek(n);
        pos_ += n;
        return res;
    }

    void append(const std::string& data) {
        data_ += data;
    }

    const std::string& data() const { return data_; }
    std::size_t pos() const { return pos_; }

private:
    std::string data_;
    std::size_t pos_ = 0;
};

} // namespace dlid
