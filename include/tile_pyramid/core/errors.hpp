#pragma once

#include <stdexcept>
#include <string>

namespace tile_pyramid {

class TilePyramidError : public std::runtime_error {
public:
    explicit TilePyramidError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TilePyramidError {
public:
    explicit ConfigError(const std::string& message)
        : TilePyramidError("Config error: " + message) {}
};

class ValidationError : public TilePyramidError {
public:
    explicit ValidationError(const std::string& message)
        : TilePyramidError("Validation error: " + message) {}
};

class IOError : public TilePyramidError {
public:
    explicit IOError(const std::string& message)
        : TilePyramidError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class MetadataError : public TilePyramidError {
public:
    explicit MetadataError(const std::string& message)
        : TilePyramidError("Metadata error: " + message) {}
};

class StorageNotFoundError : public TilePyramidError {
public:
    explicit StorageNotFoundError(const std::string& message)
        : TilePyramidError("Storage not found: " + message) {}
};

class NetworkError : public TilePyramidError {
public:
    explicit NetworkError(const std::string& message)
        : TilePyramidError("Network error: " + message) {}
};

// One PUT attempt ran out of time; callers retry on this.
class TransportTimeout : public NetworkError {
public:
    explicit TransportTimeout(const std::string& message)
        : NetworkError("timeout: " + message) {}
};

class DistributionTimeoutError : public NetworkError {
public:
    explicit DistributionTimeoutError(const std::string& message)
        : NetworkError("retries exhausted: " + message) {}
};

} // namespace tile_pyramid
