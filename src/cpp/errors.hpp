#pragma once

#include <stdexcept>
#include <string>

// Reading or writing a path failed; message carries the system error
class FileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed input to a JSON operation
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The menu could not be built or installed. Fatal at startup.
class MenuBuildError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
