#pragma once

#include <stdexcept>
#include <string>

namespace bc {

// A path could not be read or written.
class IOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A container file is corrupt or not in a supported layout.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Planes of a stack disagree in size or type, or a channel is missing.
class ShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An ROI or mask does not fit the image it is applied to.
class GeometryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The run was cancelled by the operator or a signal.
class Cancelled : public std::runtime_error {
public:
    Cancelled() : std::runtime_error("run cancelled") {}
    using std::runtime_error::runtime_error;
};

} // namespace bc
