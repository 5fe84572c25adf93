#ifndef PAREX_ERROR_HPP
#define PAREX_ERROR_HPP

#include <cstddef>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace parex {

enum class ErrorKind {
    // Traversal
    PermissionDenied,
    NotFound,
    InvalidSource,
    SymlinkLoop,

    // Configuration
    InvalidPattern,
    InvalidThreadCount,

    // Runtime
    ThreadPoolFailure,
    IoError,

    // Raised by third-party producers and predicates
    ProducerError,
    PredicateError
};

const char* to_string(ErrorKind kind);

/**
 * Every failure a search can report.
 *
 * Recoverable errors (permission denied, not found, symlink loop, I/O)
 * travel as values next to entries and never abort a run. Everything else
 * is fatal and is thrown from run().
 *
 * Errors raised by foreign code keep the original exception as cause(),
 * so callers can walk the chain without knowing the concrete type.
 */
class ParexError : public std::runtime_error {
public:
    ParexError(ErrorKind kind, const std::string& message,
               std::optional<std::filesystem::path> path = std::nullopt,
               std::error_code code = {},
               std::exception_ptr cause = nullptr);

    static ParexError permission_denied(const std::filesystem::path& path);
    static ParexError not_found(const std::filesystem::path& path);
    static ParexError invalid_source(const std::filesystem::path& path);
    static ParexError symlink_loop(const std::filesystem::path& path);
    static ParexError invalid_pattern(const std::string& detail);
    static ParexError invalid_thread_count(std::size_t count);
    static ParexError thread_pool_failure(const std::string& detail,
                                          std::exception_ptr cause = nullptr);
    static ParexError io_error(const std::filesystem::path& path, std::error_code code);
    static ParexError io_error(const std::filesystem::path& path, std::exception_ptr cause);
    static ParexError producer_error(const std::string& detail,
                                     std::exception_ptr cause = nullptr);
    static ParexError predicate_error(const std::string& detail,
                                      std::exception_ptr cause = nullptr);

    /**
     * Map an OS error onto the taxonomy: EACCES/EPERM become
     * PermissionDenied, ENOENT NotFound, ELOOP SymlinkLoop, the rest IoError.
     */
    static ParexError from_error_code(const std::filesystem::path& path, std::error_code code);

    ErrorKind kind() const noexcept { return kind_; }

    // The path the error occurred at, for "skipped: <path>" style reporting
    const std::optional<std::filesystem::path>& path() const noexcept { return path_; }

    const std::error_code& code() const noexcept { return code_; }

    std::exception_ptr cause() const noexcept { return cause_; }

    bool is_recoverable() const noexcept;

    bool is_fatal() const noexcept { return !is_recoverable(); }

    // what() followed by ": caused by ..." for each link of the cause chain
    std::string describe() const;

private:
    ErrorKind kind_;
    std::optional<std::filesystem::path> path_;
    std::error_code code_;
    std::exception_ptr cause_;
};

} // namespace parex

#endif // PAREX_ERROR_HPP
