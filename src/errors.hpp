#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Chapter content could not be produced. Transient errors are retried by the
// provider itself; anything that escapes it stops the run.
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& what, bool transient)
        : std::runtime_error(what), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

// A single image could not be fetched or is not a usable image.
class AssetError : public std::runtime_error {
public:
    AssetError(const std::string& what, std::string url, bool transient)
        : std::runtime_error(what), url_(std::move(url)), transient_(transient) {}

    const std::string& url() const { return url_; }
    bool transient() const { return transient_; }

private:
    std::string url_;
    bool transient_;
};

class AssemblyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
