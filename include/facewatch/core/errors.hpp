#pragma once
#include <stdexcept>
#include <string>

namespace facewatch {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Empty or inconsistent input to SimilarityIndex::build_index.
// The index keeps its previous snapshot.
class BuildError : public Error {
public:
    explicit BuildError(const std::string& what) : Error(what) {}
};

// Enrollment under a name that is already in the catalog
class NameConflict : public Error {
public:
    explicit NameConflict(const std::string& name)
        : Error("Identity already exists: " + name), name(name) {}

    std::string name;
};

// Persistent store write failed. Never reaches the matching path.
class TransientIOError : public Error {
public:
    explicit TransientIOError(const std::string& what) : Error(what) {}
};

} // namespace facewatch
