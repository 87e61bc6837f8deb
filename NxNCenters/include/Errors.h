#pragma once

#include <stdexcept>
#include <string>

// Broken invariant or programmer error; never caught inside the library
class InternalError : public std::runtime_error {
public:
    explicit InternalError(const std::string& what) : std::runtime_error(what) {}
};

// Raised by the operator between two moves once an abort was requested
class OpAbortedError : public std::runtime_error {
public:
    OpAbortedError() : std::runtime_error("operation aborted") {}
};

class AlgParseError : public std::runtime_error {
public:
    explicit AlgParseError(const std::string& what) : std::runtime_error(what) {}
};
