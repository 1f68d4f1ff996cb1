#pragma once

#include <stdexcept>
#include <string>

namespace cyclebt {

// Malformed input bar. Fatal for the instrument it belongs to only.
class InvalidBarError : public std::runtime_error {
public:
    InvalidBarError(const std::string& instrument, long long timestamp, const std::string& what)
        : std::runtime_error(what)
        , instrument_(instrument)
        , timestamp_(timestamp) {}

    const std::string& instrument() const { return instrument_; }
    long long timestamp() const { return timestamp_; }

private:
    std::string instrument_;
    long long timestamp_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Capital or position-count bookkeeping broke. Always a bug, never input driven.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace cyclebt
