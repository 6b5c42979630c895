#pragma once
// Purpose: Error types raised by the DL/ID parser.
// InsufficientData is the "wait for more input" signal and does not derive from ParseError.

#include <stdexcept>
#include <string>

namespace dlid {

// Buffer under-run. Recoverable by appending more data and parsing again.
class InsufficientData : public std::runtime_error {
public:
    InsufficientData() : std::runtime_error("insufficient data") {}
};

// General structural failure (bad "ANSI " literal, non-numeric count/offset/length, bad record key).
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad leading '@' or a forbidden separator character.
class HeaderParseError : public ParseError {
public:
    explicit HeaderParseError(const std::string& msg) : ParseError(msg) {}
};

enum class ErrorKind {
    None,
    Header,
    Structure
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Header:    return "header";
        case ErrorKind::Structure: return "structure";
        default:                   return "none";
    }
}

} // namespace dlid
