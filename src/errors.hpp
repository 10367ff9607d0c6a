#pragma once

#include <stdexcept>
#include <string>

// Logical time regression on the input session. The session state is untouched.
class COrderingError : public std::runtime_error {
public:
    explicit COrderingError(const std::string& what) : std::runtime_error(what) {}
};

// Price value does not fit the fixed-point representation.
class CPrecisionError : public std::runtime_error {
public:
    explicit CPrecisionError(const std::string& what) : std::runtime_error(what) {}
};

// The batch queue was stopped, usually because the engine thread failed.
class CQueueClosedError : public std::runtime_error {
public:
    explicit CQueueClosedError(const std::string& what) : std::runtime_error(what) {}
};
