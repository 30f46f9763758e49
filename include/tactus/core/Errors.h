#ifndef TACTUS_CORE_ERRORS_H
#define TACTUS_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace tactus::core {

/**
 * @brief The audio container could not be turned into samples.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief The container bytes themselves are malformed or not audio.
 *
 * Reported to callers with the encodingError flag so a bad file can be told
 * apart from a bad environment.
 */
class EncodingError : public DecodeError {
public:
    explicit EncodingError(const std::string& what) : DecodeError(what) {}
};

/**
 * @brief The decoding capability a request needs is not present in this build or configuration.
 */
class EnvironmentUnavailableError : public std::runtime_error {
public:
    explicit EnvironmentUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace tactus::core

#endif // TACTUS_CORE_ERRORS_H
