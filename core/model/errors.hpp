#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vibescore {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every condition that aborts an analysis run derives from Error.
// RetrievalFailure is the only one the pipeline recovers from: the
// offending change is skipped and the run continues.

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// No version-control store at the working location.
class RepositoryUnavailable : public Error {
public:
    explicit RepositoryUnavailable(const std::string& location)
        : Error("Not a git repository: " + location +
                " (run inside a repository or pass --repo)") {}
};

/// The history has no authors or no changes.
class NoHistory : public Error {
public:
    explicit NoHistory(const std::string& what)
        : Error("No history found: " + what) {}
};

/// One change's diff or metadata could not be fetched or parsed.
class RetrievalFailure : public Error {
public:
    using Error::Error;
};

/// A quiz track ended up with too few questions to be meaningful.
class InsufficientMaterial : public Error {
public:
    InsufficientMaterial(const std::string& track, size_t available, size_t required)
        : Error("Not enough " + track + " snippets for a quiz: found " +
                std::to_string(available) + ", need at least " +
                std::to_string(required) + ". More commit history is required."),
          track_(track), available_(available), required_(required) {}

    const std::string& track() const { return track_; }
    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    std::string track_;
    size_t available_;
    size_t required_;
};

} // namespace vibescore
