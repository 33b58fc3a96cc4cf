#pragma once

#include <stdexcept>
#include <string>

// Bad rate/duration values, raised where they are supplied.
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) {}
};

class WavFormatError : public std::runtime_error {
public:
    explicit WavFormatError(const std::string& what) : std::runtime_error(what) {}
};
