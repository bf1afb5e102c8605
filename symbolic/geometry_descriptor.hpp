#ifndef SYMPARTS_SYMBOLIC_GEOMETRY_DESCRIPTOR_HPP
#define SYMPARTS_SYMBOLIC_GEOMETRY_DESCRIPTOR_HPP

#include "symbolic_value.hpp"
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace symparts {

// Geometry of a part with every field bound to a number
class ResolvedGeometry {
public:
    ResolvedGeometry() = default;
    explicit ResolvedGeometry(std::map<std::string, double> fields)
        : fields_(std::move(fields)) {}

    // Value of a field; MalformedDocumentError if the field is absent
    double get(const std::string& field) const;
    bool has(const std::string& field) const { return fields_.count(field) > 0; }

    const std::map<std::string, double>& fields() const { return fields_; }

private:
    std::map<std::string, double> fields_;
};

// Named set of symbolic shape parameters. The field set is dictated by the
// part type; check_fields() enforces it against the declared list.
class GeometryDescriptor {
public:
    GeometryDescriptor() = default;
    GeometryDescriptor(std::initializer_list<std::pair<const std::string, SymbolicValue>> fields)
        : fields_(fields) {}

    void set(const std::string& field, SymbolicValue value) { fields_[field] = std::move(value); }
    bool has(const std::string& field) const { return fields_.count(field) > 0; }
    const SymbolicValue& at(const std::string& field) const;

    const std::map<std::string, SymbolicValue>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    bool is_resolved() const;

    // All fields as numbers; UnresolvedParameterError names "<owner>.geometry.<field>"
    ResolvedGeometry resolve(const std::string& owner) const;

    // Throws MalformedDocumentError unless the field names equal declared exactly
    void check_fields(const std::vector<std::string>& declared, const std::string& owner) const;

    std::size_t bind(const std::string& name, double value);
    void collect_free_parameters(std::set<std::string>& out) const;

    bool operator==(const GeometryDescriptor& other) const = default;

private:
    std::map<std::string, SymbolicValue> fields_;
};

}  // namespace symparts

#endif // SYMPARTS_SYMBOLIC_GEOMETRY_DESCRIPTOR_HPP
