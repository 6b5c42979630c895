#include "parser.hpp"

#include <stdexcept>
#include <utility>

#include "designators.hpp"
#include "header.hpp"
#include "subfiles.hpp"
#include "../logger.hpp"

namespace dlid {

Parser::Parser(std::string initial)
    : reader_(std::move(initial)),
      engine_({make_header_step(reader_), make_designators_step(reader_), make_subfiles_step(reader_)}) {}

const ParseResult& Parser::parse() {
    if (result_) return *result_;
    try {
        const ParseResult& res = engine_.run();
        result_ = res;
        logger::info("DL/ID parse complete: IIN " + res.header.iin + ", " +
                     std::to_string(res.subfile_designators.size()) + " subfiles");
        return *result_;
    } catch (const HeaderParseError& e) {
        if (error_kind_ == ErrorKind::None) {
            error_kind_ = ErrorKind::Header;
            error_message_ = e.what();
            logger::error(std::string("DL/ID header error: ") + e.what());
        }
        throw;
    } catch (const ParseError& e) {
        if (error_kind_ == ErrorKind::None) {
            error_kind_ = ErrorKind::Structure;
            error_message_ = e.what();
            logger::error(std::string("DL/ID parse error: ") + e.what());
        }
        throw;
    }
}

bool Parser::append(const std::string& data) {
    reader_.append(data);
    if (result_ || has_error()) return false;
    try {
        (void)parse();
        return false;
    } catch (const InsufficientData&) {
        return true;
    } catch (const ParseError&) {
        // recorded by parse()
        return false;
    }
}

const ParseResult& Parser::result() const {
    if (!result_) {
        throw std::logic_error("DL/ID parse not complete");
    }
    return *result_;
}

} // namespace dlid
