#pragma once

#include <string>
#include <utility>

namespace vibescore {

/// An author identity as recorded by the version-control system.
/// (name, email) is the unique key; commit_count grows as records
/// are aggregated.
struct Identity {
    std::string name;
    std::string email;
    int commit_count = 0;

    Identity() = default;
    Identity(std::string n, std::string e, int commits = 0)
        : name(std::move(n)), email(std::move(e)), commit_count(commits) {}

    /// "name|email", the form used to select identities.
    std::string key() const { return name + "|" + email; }

    bool operator==(const Identity& other) const {
        return name == other.name && email == other.email;
    }
};

} // namespace vibescore
