#pragma once

#include <EASTL/string.h>
#include <cstdint>

namespace ember {

class Exception {
public:
    explicit Exception(const eastl::string& message) : message_(message) {}
    explicit Exception(const char* message) : message_(message) {}
    virtual ~Exception() = default;

    const eastl::string& what() const { return message_; }
    const char* what_c_str() const { return message_.c_str(); }

protected:
    eastl::string message_;
};

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const eastl::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

// Graph authorship errors. A frame that raised one of these is corrupt.
enum class GraphErrorKind {
    DuplicateInsert,
    UndeclaredAccess,
    PhaseViolation,
    StaleHandle,
    UnresolvedResource,
    IdSpaceExhausted,
    MissingDescriptor,
    MissingWorldResource,
    IllegalRetain
};

constexpr const char* toString(GraphErrorKind kind) {
    switch (kind) {
        case GraphErrorKind::DuplicateInsert:      return "DuplicateInsert";
        case GraphErrorKind::UndeclaredAccess:     return "UndeclaredAccess";
        case GraphErrorKind::PhaseViolation:       return "PhaseViolation";
        case GraphErrorKind::StaleHandle:          return "StaleHandle";
        case GraphErrorKind::UnresolvedResource:   return "UnresolvedResource";
        case GraphErrorKind::IdSpaceExhausted:     return "IdSpaceExhausted";
        case GraphErrorKind::MissingDescriptor:    return "MissingDescriptor";
        case GraphErrorKind::MissingWorldResource: return "MissingWorldResource";
        case GraphErrorKind::IllegalRetain:        return "IllegalRetain";
    }
    return "Unknown";
}

class GraphError : public RuntimeError {
public:
    GraphError(GraphErrorKind kind, const eastl::string& message) : RuntimeError(message), kind_(kind) {}

    GraphErrorKind kind() const { return kind_; }

private:
    GraphErrorKind kind_;
};

// Thrown by RenderDevice implementations when the backend refuses an allocation
class DeviceError : public RuntimeError {
public:
    DeviceError(const eastl::string& message, int32_t resultCode) : RuntimeError(message), resultCode_(resultCode) {}

    int32_t resultCode() const { return resultCode_; }

private:
    int32_t resultCode_;
};

} // namespace ember
