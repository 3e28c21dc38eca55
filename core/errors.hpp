#pragma once

#include <stdexcept>
#include <string>

namespace marionette::core {

enum class LoadErrorKind {
    MalformedStructure,
    DanglingReference,
    VertexCountMismatch,
    UnknownNodeVariant,
};

inline const char* loadErrorKindName(LoadErrorKind kind) {
    switch (kind) {
    case LoadErrorKind::MalformedStructure: return "MalformedStructure";
    case LoadErrorKind::DanglingReference: return "DanglingReference";
    case LoadErrorKind::VertexCountMismatch: return "VertexCountMismatch";
    case LoadErrorKind::UnknownNodeVariant: return "UnknownNodeVariant";
    }
    return "Unknown";
}

// Rejection of a whole puppet during load-time validation.
class PuppetLoadError : public std::runtime_error {
public:
    PuppetLoadError(LoadErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(loadErrorKindName(kind)) + ": " + message), kind_(kind) {}

    LoadErrorKind kind() const { return kind_; }

private:
    LoadErrorKind kind_;
};

} // namespace marionette::core
