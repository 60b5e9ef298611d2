#pragma once

#include <stdexcept>
#include <string>

namespace model {

// Malformed input to a decode. The decode that throws leaves its target untouched.
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace model
