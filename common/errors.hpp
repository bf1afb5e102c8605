#ifndef SYMPARTS_COMMON_ERRORS_HPP
#define SYMPARTS_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace symparts {

namespace detail {

inline std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

}  // namespace detail

// Base class for every condition raised while loading, binding or resolving an assembly.
class AssemblyError : public std::runtime_error {
public:
    explicit AssemblyError(const std::string& message)
        : std::runtime_error(message) {}

    // Short identifier of the error kind, used in batch results and CLI output
    virtual const char* kind() const noexcept { return "AssemblyError"; }
};

// Structural or schema violation in a document or in programmatic construction.
class MalformedDocumentError : public AssemblyError {
public:
    MalformedDocumentError(std::string context, const std::string& message)
        : AssemblyError("Malformed assembly (" + context + "): " + message)
        , context_(std::move(context)) {}

    const char* kind() const noexcept override { return "MalformedDocumentError"; }

    // Location of the violation, e.g. "parts[2].geometry.radius"
    const std::string& context() const { return context_; }

private:
    std::string context_;
};

// A part type identifier that the supplied catalog does not know.
class UnknownPartTypeError : public MalformedDocumentError {
public:
    UnknownPartTypeError(const std::string& part_name, std::string type_id)
        : MalformedDocumentError(part_name, "unknown part type \"" + type_id + "\"")
        , type_id_(std::move(type_id)) {}

    const char* kind() const noexcept override { return "UnknownPartTypeError"; }

    const std::string& type_id() const { return type_id_; }

private:
    std::string type_id_;
};

// A concrete number was required but a free parameter remained.
class UnresolvedParameterError : public AssemblyError {
public:
    UnresolvedParameterError(std::string field, std::string symbol)
        : AssemblyError("Unresolved parameter \"" + symbol + "\" at " + field)
        , field_(std::move(field))
        , symbol_(std::move(symbol)) {}

    const char* kind() const noexcept override { return "UnresolvedParameterError"; }

    const std::string& field() const { return field_; }
    const std::string& symbol() const { return symbol_; }

private:
    std::string field_;
    std::string symbol_;
};

// Strict binding received a parameter name that appears nowhere in the graph.
class UnknownParameterError : public AssemblyError {
public:
    explicit UnknownParameterError(std::string parameter)
        : AssemblyError("Unknown parameter \"" + parameter + "\": no matching free parameter in assembly")
        , parameter_(std::move(parameter)) {}

    const char* kind() const noexcept override { return "UnknownParameterError"; }

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

class NoRootError : public AssemblyError {
public:
    explicit NoRootError(const std::string& assembly_name)
        : AssemblyError("Assembly \"" + assembly_name +
                        "\" has no part with a fully resolved static origin and placement") {}

    const char* kind() const noexcept override { return "NoRootError"; }
};

class AmbiguousRootError : public AssemblyError {
public:
    explicit AmbiguousRootError(std::vector<std::string> candidates)
        : AssemblyError("Multiple anchor parts: " + detail::join_names(candidates))
        , candidates_(std::move(candidates)) {}

    const char* kind() const noexcept override { return "AmbiguousRootError"; }

    const std::vector<std::string>& candidates() const { return candidates_; }

private:
    std::vector<std::string> candidates_;
};

// Parts with no attachment path to the anchor; their placement is undefined.
class DisconnectedPartError : public AssemblyError {
public:
    explicit DisconnectedPartError(std::vector<std::string> parts)
        : AssemblyError("Parts not attached to the anchor: " + detail::join_names(parts))
        , parts_(std::move(parts)) {}

    const char* kind() const noexcept override { return "DisconnectedPartError"; }

    const std::vector<std::string>& parts() const { return parts_; }

private:
    std::vector<std::string> parts_;
};

// The attachment edges contain a cycle; placement requires a tree.
class CyclicAttachmentError : public AssemblyError {
public:
    explicit CyclicAttachmentError(std::string edge)
        : AssemblyError("Attachment cycle closed by edge " + edge)
        , edge_(std::move(edge)) {}

    const char* kind() const noexcept override { return "CyclicAttachmentError"; }

    const std::string& edge() const { return edge_; }

private:
    std::string edge_;
};

}  // namespace symparts

#endif // SYMPARTS_COMMON_ERRORS_HPP
