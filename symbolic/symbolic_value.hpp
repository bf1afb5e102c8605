#ifndef SYMPARTS_SYMBOLIC_SYMBOLIC_VALUE_HPP
#define SYMPARTS_SYMBOLIC_SYMBOLIC_VALUE_HPP

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>

namespace symparts {

// A named free parameter
struct Symbol {
    std::string name;

    bool operator==(const Symbol& other) const = default;
};

// A number that is either concrete or still a named free parameter.
//
// Arithmetic and ordering only work on concrete operands and throw
// UnresolvedParameterError otherwise. Equality is structural: two symbols are
// equal when their names match, two numbers when they are bitwise equal.
class SymbolicValue {
public:
    SymbolicValue() : value_(0.0) {}
    SymbolicValue(double value) : value_(value) {}
    SymbolicValue(Symbol symbol) : value_(std::move(symbol)) {}

    static SymbolicValue concrete(double value) { return SymbolicValue(value); }
    static SymbolicValue symbol(std::string name) { return SymbolicValue(Symbol{std::move(name)}); }

    bool is_resolved() const { return std::holds_alternative<double>(value_); }
    bool is_symbol() const { return std::holds_alternative<Symbol>(value_); }

    // Concrete number; throws UnresolvedParameterError for a symbol
    double value() const;

    std::optional<std::string> symbol_name() const;

    // Replace a matching symbol by a concrete value. Returns true if replaced.
    bool bind(const std::string& name, double value);
    SymbolicValue bound(const std::string& name, double value) const;

    void collect_free_parameters(std::set<std::string>& out) const;
    std::set<std::string> free_parameter_names() const;

    const std::variant<double, Symbol>& variant() const { return value_; }

    // Number formatted for humans, or the symbol name
    std::string to_string() const;

    bool operator==(const SymbolicValue& other) const = default;

private:
    std::variant<double, Symbol> value_;
};

// Concrete value of a field, or UnresolvedParameterError naming field_path
double resolve_field(const SymbolicValue& value, const std::string& field_path);

SymbolicValue operator+(const SymbolicValue& a, const SymbolicValue& b);
SymbolicValue operator-(const SymbolicValue& a, const SymbolicValue& b);
SymbolicValue operator*(const SymbolicValue& a, const SymbolicValue& b);
SymbolicValue operator/(const SymbolicValue& a, const SymbolicValue& b);
SymbolicValue operator-(const SymbolicValue& a);

bool operator<(const SymbolicValue& a, const SymbolicValue& b);
bool operator<=(const SymbolicValue& a, const SymbolicValue& b);
bool operator>(const SymbolicValue& a, const SymbolicValue& b);
bool operator>=(const SymbolicValue& a, const SymbolicValue& b);

}  // namespace symparts

#endif // SYMPARTS_SYMBOLIC_SYMBOLIC_VALUE_HPP
