#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace muxcache {

/**
 * Base class for errors raised by the caching layer
 */
class MuxError : public std::runtime_error {
public:
    explicit MuxError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Transient transport failure (no connection, host unreachable, connection lost).
 *
 * Producers should report reachability problems with this type so that the
 * default fallback policy can serve a previously cached value instead.
 */
class ConnectivityError : public MuxError {
public:
    explicit ConnectivityError(const std::string& message)
        : MuxError(message) {}
};

/**
 * Terminal download failure
 */
class DownloadError : public MuxError {
public:
    DownloadError(const std::string& message, int status_code = 0)
        : MuxError(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Blob post-processing failure (the downloaded artifact could not be loaded)
 */
class TransformError : public MuxError {
public:
    explicit TransformError(const std::string& message)
        : MuxError(message) {}
};

/**
 * Persistent store write failure
 */
class StorageError : public MuxError {
public:
    explicit StorageError(const std::string& message)
        : MuxError(message) {}
};

/**
 * Misuse of the cache registry, e.g. two caches registered under one ID
 */
class RegistryError : public std::logic_error {
public:
    explicit RegistryError(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * Default transient-error predicate: true for ConnectivityError only
 */
bool is_connectivity_error(const std::exception_ptr& error);

/**
 * Extract a printable message from an exception pointer
 */
std::string error_message(const std::exception_ptr& error);

} // namespace muxcache
