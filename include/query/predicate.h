#pragma once

/**
 * Predicate tree for relational-style WHERE clauses.
 *
 * Value-semantic and immutable once built; one tree per request.
 *
 * Example:
 *   age > 18 AND (city == "Berlin" OR city == ^0)
 *
 *   Predicate::and_({
 *       Predicate::cmp(">", "age", 18),
 *       Predicate::or_({
 *           Predicate::eq("city", "Berlin"),
 *           Predicate::eq("city", Placeholder{0})
 *       })
 *   });
 */

#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace docbridge {
namespace query {

/// Positional reference into the parameter list supplied at compile time
struct Placeholder {
    size_t index = 0;

    bool operator==(const Placeholder& o) const { return index == o.index; }
};

/// Literal JSON value or a placeholder resolved at compile time
using Operand = std::variant<nlohmann::json, Placeholder>;

struct Predicate {
    struct Eq {
        std::string field;
        Operand value;
    };

    /// op is kept as written (">", "<=", ...) and validated by the compiler
    struct Cmp {
        std::string op;
        std::string field;
        Operand value;
    };

    /// Placeholders resolving to a list are spliced into the value list
    struct In {
        std::string field;
        std::vector<Operand> values;
    };

    struct And { std::vector<Predicate> children; };
    struct Or  { std::vector<Predicate> children; };

    /// A whole parameter used as a ready-made selector fragment
    struct Param { Placeholder placeholder; };

    std::variant<Eq, Cmp, In, And, Or, Param> node;

    static Predicate eq(std::string field, Operand value);
    static Predicate cmp(std::string op, std::string field, Operand value);
    static Predicate in(std::string field, std::vector<Operand> values);
    static Predicate and_(std::vector<Predicate> children);
    static Predicate or_(std::vector<Predicate> children);
    static Predicate param(size_t index);
};

} // namespace query
} // namespace docbridge
