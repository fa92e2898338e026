#ifndef JIGSAW_ERROR_HPP
#define JIGSAW_ERROR_HPP

#include <stdexcept>
#include <string>

namespace jigsaw {

class JigsawError : public std::runtime_error {
public:
    explicit JigsawError(const std::string& message)
        : std::runtime_error(message) {}
};

// Unreadable source, unwritable output, missing fragment
class IOError : public JigsawError {
public:
    explicit IOError(const std::string& message)
        : JigsawError("I/O error: " + message) {}
};

// Malformed key file
class FormatError : public JigsawError {
public:
    explicit FormatError(const std::string& message)
        : JigsawError("Format error: " + message) {}
};

class NameCollisionError : public JigsawError {
public:
    explicit NameCollisionError(const std::string& message)
        : JigsawError("Name collision: " + message) {}
};

class ConfigError : public JigsawError {
public:
    explicit ConfigError(const std::string& message)
        : JigsawError("Configuration error: " + message) {}
};

// Only raised when decoding in strict mode
class FidelityError : public JigsawError {
public:
    explicit FidelityError(const std::string& message)
        : JigsawError("Fidelity error: " + message) {}
};

} // namespace jigsaw

#endif // JIGSAW_ERROR_HPP
