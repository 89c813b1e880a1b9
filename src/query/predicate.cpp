#include "query/predicate.h"

namespace docbridge {
namespace query {

Predicate Predicate::eq(std::string field, Operand value) {
    return Predicate{Eq{std::move(field), std::move(value)}};
}

Predicate Predicate::cmp(std::string op, std::string field, Operand value) {
    return Predicate{Cmp{std::move(op), std::move(field), std::move(value)}};
}

Predicate Predicate::in(std::string field, std::vector<Operand> values) {
    return Predicate{In{std::move(field), std::move(values)}};
}

Predicate Predicate::and_(std::vector<Predicate> children) {
    return Predicate{And{std::move(children)}};
}

Predicate Predicate::or_(std::vector<Predicate> children) {
    return Predicate{Or{std::move(children)}};
}

Predicate Predicate::param(size_t index) {
    return Predicate{Param{Placeholder{index}}};
}

} // namespace query
} // namespace docbridge
