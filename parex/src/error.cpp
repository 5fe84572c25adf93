#include <parex/error.hpp>

#include <utility>

namespace parex {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PermissionDenied: return "PermissionDenied";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidSource: return "InvalidSource";
        case ErrorKind::SymlinkLoop: return "SymlinkLoop";
        case ErrorKind::InvalidPattern: return "InvalidPattern";
        case ErrorKind::InvalidThreadCount: return "InvalidThreadCount";
        case ErrorKind::ThreadPoolFailure: return "ThreadPoolFailure";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::ProducerError: return "ProducerError";
        case ErrorKind::PredicateError: return "PredicateError";
    }
    return "Unknown";
}

namespace {

std::string describe_cause(const std::exception_ptr& cause) {
    std::string text;
    std::exception_ptr current = cause;

    while (current) {
        std::exception_ptr next;
        try {
            std::rethrow_exception(current);
        } catch (const ParexError& e) {
            text += ": caused by ";
            text += e.what();
            next = e.cause();
        } catch (const std::nested_exception& e) {
            // std::throw_with_nested chains: message first, then the nested one
            if (const auto* as_std = dynamic_cast<const std::exception*>(&e)) {
                text += ": caused by ";
                text += as_std->what();
            }
            next = e.nested_ptr();
        } catch (const std::exception& e) {
            text += ": caused by ";
            text += e.what();
        } catch (...) {
            text += ": caused by unknown exception";
        }
        current = next;
    }

    return text;
}

} // namespace

ParexError::ParexError(ErrorKind kind, const std::string& message,
                       std::optional<std::filesystem::path> path,
                       std::error_code code, std::exception_ptr cause)
    : std::runtime_error(message), kind_(kind), path_(std::move(path)),
      code_(code), cause_(std::move(cause)) {}

ParexError ParexError::permission_denied(const std::filesystem::path& path) {
    return ParexError(ErrorKind::PermissionDenied, "permission denied: " + path.string(), path);
}

ParexError ParexError::not_found(const std::filesystem::path& path) {
    return ParexError(ErrorKind::NotFound, "path not found: " + path.string(), path);
}

ParexError ParexError::invalid_source(const std::filesystem::path& path) {
    return ParexError(ErrorKind::InvalidSource, "invalid source: " + path.string(), path);
}

ParexError ParexError::symlink_loop(const std::filesystem::path& path) {
    return ParexError(ErrorKind::SymlinkLoop, "symlink loop: " + path.string(), path);
}

ParexError ParexError::invalid_pattern(const std::string& detail) {
    return ParexError(ErrorKind::InvalidPattern, "invalid pattern: " + detail);
}

ParexError ParexError::invalid_thread_count(std::size_t count) {
    return ParexError(ErrorKind::InvalidThreadCount,
                      "invalid thread count: " + std::to_string(count));
}

ParexError ParexError::thread_pool_failure(const std::string& detail, std::exception_ptr cause) {
    return ParexError(ErrorKind::ThreadPoolFailure, "thread pool failure: " + detail,
                      std::nullopt, {}, std::move(cause));
}

ParexError ParexError::io_error(const std::filesystem::path& path, std::error_code code) {
    return ParexError(ErrorKind::IoError, "IO error at " + path.string(), path, code);
}

ParexError ParexError::io_error(const std::filesystem::path& path, std::exception_ptr cause) {
    return ParexError(ErrorKind::IoError, "IO error at " + path.string(), path, {},
                      std::move(cause));
}

ParexError ParexError::producer_error(const std::string& detail, std::exception_ptr cause) {
    return ParexError(ErrorKind::ProducerError, "source error: " + detail,
                      std::nullopt, {}, std::move(cause));
}

ParexError ParexError::predicate_error(const std::string& detail, std::exception_ptr cause) {
    return ParexError(ErrorKind::PredicateError, "matcher error: " + detail,
                      std::nullopt, {}, std::move(cause));
}

ParexError ParexError::from_error_code(const std::filesystem::path& path, std::error_code code) {
    if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted) {
        return ParexError(ErrorKind::PermissionDenied, "permission denied: " + path.string(),
                          path, code);
    }
    if (code == std::errc::no_such_file_or_directory) {
        return ParexError(ErrorKind::NotFound, "path not found: " + path.string(), path, code);
    }
    if (code == std::errc::too_many_symbolic_link_levels) {
        return ParexError(ErrorKind::SymlinkLoop, "symlink loop: " + path.string(), path, code);
    }
    return io_error(path, code);
}

bool ParexError::is_recoverable() const noexcept {
    switch (kind_) {
        case ErrorKind::PermissionDenied:
        case ErrorKind::NotFound:
        case ErrorKind::SymlinkLoop:
        case ErrorKind::IoError:
            return true;
        default:
            return false;
    }
}

std::string ParexError::describe() const {
    std::string text = what();
    if (code_) {
        text += " (" + code_.message() + ")";
    }
    return text + describe_cause(cause_);
}

} // namespace parex
