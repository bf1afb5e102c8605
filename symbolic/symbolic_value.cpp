#include "symbolic_value.hpp"
#include <common/errors.hpp>
#include <sstream>
#include <type_traits>

namespace symparts {

namespace {

constexpr const char* kOperandField = "arithmetic operand";

// Both operands as numbers, or the first offending symbol
std::pair<double, double> require_concrete(const SymbolicValue& a, const SymbolicValue& b) {
    return {resolve_field(a, kOperandField), resolve_field(b, kOperandField)};
}

}  // namespace

double SymbolicValue::value() const {
    return resolve_field(*this, "value");
}

std::optional<std::string> SymbolicValue::symbol_name() const {
    if (const auto* sym = std::get_if<Symbol>(&value_)) {
        return sym->name;
    }
    return std::nullopt;
}

bool SymbolicValue::bind(const std::string& name, double value) {
    const auto* sym = std::get_if<Symbol>(&value_);
    if (sym == nullptr || sym->name != name) {
        return false;
    }
    value_ = value;
    return true;
}

SymbolicValue SymbolicValue::bound(const std::string& name, double value) const {
    SymbolicValue copy = *this;
    copy.bind(name, value);
    return copy;
}

void SymbolicValue::collect_free_parameters(std::set<std::string>& out) const {
    if (const auto* sym = std::get_if<Symbol>(&value_)) {
        out.insert(sym->name);
    }
}

std::set<std::string> SymbolicValue::free_parameter_names() const {
    std::set<std::string> names;
    collect_free_parameters(names);
    return names;
}

std::string SymbolicValue::to_string() const {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        } else {
            return arg.name;
        }
    }, value_);
}

double resolve_field(const SymbolicValue& value, const std::string& field_path) {
    if (const auto* number = std::get_if<double>(&value.variant())) {
        return *number;
    }
    throw UnresolvedParameterError(field_path, std::get<Symbol>(value.variant()).name);
}

SymbolicValue operator+(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return SymbolicValue(x + y);
}

SymbolicValue operator-(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return SymbolicValue(x - y);
}

SymbolicValue operator*(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return SymbolicValue(x * y);
}

SymbolicValue operator/(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return SymbolicValue(x / y);
}

SymbolicValue operator-(const SymbolicValue& a) {
    return SymbolicValue(-resolve_field(a, kOperandField));
}

bool operator<(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return x < y;
}

bool operator<=(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return x <= y;
}

bool operator>(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return x > y;
}

bool operator>=(const SymbolicValue& a, const SymbolicValue& b) {
    auto [x, y] = require_concrete(a, b);
    return x >= y;
}

}  // namespace symparts
