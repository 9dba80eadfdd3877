#pragma once

#include <stdexcept>
#include <string>

namespace racetrack::track {

class ShapeMismatchError : public std::invalid_argument {
public:
    explicit ShapeMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

class BoundsError : public std::out_of_range {
public:
    explicit BoundsError(const std::string& what)
        : std::out_of_range(what) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace racetrack::track
