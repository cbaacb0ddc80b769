#pragma once

#include <stdexcept>
#include <string>

namespace drop_synth {

class DropSynthError : public std::runtime_error {
public:
    explicit DropSynthError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public DropSynthError {
public:
    explicit ConfigError(const std::string& message)
        : DropSynthError("Config error: " + message) {}
};

class ValidationError : public DropSynthError {
public:
    explicit ValidationError(const std::string& message)
        : DropSynthError("Validation error: " + message) {}
};

class IOError : public DropSynthError {
public:
    explicit IOError(const std::string& message)
        : DropSynthError("I/O error: " + message) {}
};

// Raised inside the texture warper; never escapes it (the warper falls back
// to the unwarped patch).
class WarpError : public DropSynthError {
public:
    explicit WarpError(const std::string& message)
        : DropSynthError("Warp error: " + message) {}
};

class PipelineError : public DropSynthError {
public:
    explicit PipelineError(const std::string& message)
        : DropSynthError("Pipeline error: " + message) {}
};

} // namespace drop_synth
