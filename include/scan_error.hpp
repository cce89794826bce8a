#ifndef SCAN_ERROR_HPP
#define SCAN_ERROR_HPP
#include <stdexcept>
#include <string>

/**
 * @brief Whole-scan failures. Per-repository problems never surface as these.
 */
enum class ScanErrorKind {
    PathUnavailable,       ///< Scan root cannot be resolved or is not a directory
    NoRepositoriesFound,   ///< Discovery produced zero repository roots
    NoMatchingRepositories ///< Repositories exist but every one was filtered out
};

/**
 * @brief Exception carrying a @ref ScanErrorKind and a user-facing message.
 */
class ScanError : public std::runtime_error {
    ScanErrorKind kind_;

  public:
    ScanError(ScanErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ScanErrorKind kind() const noexcept { return kind_; }
};

#endif // SCAN_ERROR_HPP
