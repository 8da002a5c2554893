#pragma once
#include <stdexcept>
#include <string>

namespace doc_qa {

// Caller error: nothing to index.
class EmptyDocument : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Embedding backend failed while building or querying an index.
class IndexBuildFailed : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Generation backend missing or broken. Degraded mode, never fatal.
class ModelUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnsupportedDocument : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace doc_qa
