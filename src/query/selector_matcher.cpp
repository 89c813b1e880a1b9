#include "query/selector_matcher.h"

#include <algorithm>

namespace docbridge {
namespace query {

using nlohmann::json;

namespace {

int typeRank(const json& v) {
    if (v.is_null()) return 0;
    if (v.is_boolean()) return v.get<bool>() ? 2 : 1;
    if (v.is_number()) return 3;
    if (v.is_string()) return 4;
    if (v.is_array()) return 5;
    return 6;
}

bool isFieldOperator(const std::string& op) {
    return op == "$eq" || op == "$ne" || op == "$gt" || op == "$gte" ||
           op == "$lt" || op == "$lte" || op == "$in" || op == "$nin" ||
           op == "$exists" || op == "$not";
}

bool isOperatorObject(const json& v) {
    if (!v.is_object() || v.empty()) return false;
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (it.key().empty() || it.key()[0] != '$') return false;
    }
    return true;
}

} // namespace

SelectorMatcher::SelectorMatcher(json selector)
    : selector_(std::move(selector)) {}

SelectorMatcher::Status SelectorMatcher::validate() const {
    if (!selector_.is_object()) return Status::Error("selector must be an object");
    return validateSelector_(selector_);
}

bool SelectorMatcher::matches(const json& doc) const {
    return matchSelector_(selector_, doc);
}

int SelectorMatcher::compare(const json& a, const json& b) {
    int ra = typeRank(a);
    int rb = typeRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;

    switch (ra) {
        case 3: {
            if (a.is_number_float() || b.is_number_float()) {
                double x = a.get<double>();
                double y = b.get<double>();
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            if (a.is_number_unsigned() && b.is_number_unsigned()) {
                auto x = a.get<uint64_t>();
                auto y = b.get<uint64_t>();
                return x < y ? -1 : (x > y ? 1 : 0);
            }
            // Gemischt: negativer signed-Wert liegt immer unter jedem unsigned
            if (a.is_number_unsigned() != b.is_number_unsigned()) {
                const json& s = a.is_number_unsigned() ? b : a;
                const json& u = a.is_number_unsigned() ? a : b;
                int c;
                if (s.get<int64_t>() < 0) {
                    c = -1;
                } else {
                    auto x = static_cast<uint64_t>(s.get<int64_t>());
                    auto y = u.get<uint64_t>();
                    c = x < y ? -1 : (x > y ? 1 : 0);
                }
                return a.is_number_unsigned() ? -c : c;
            }
            auto x = a.get<int64_t>();
            auto y = b.get<int64_t>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        case 4: {
            int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        case 5: {
            size_t n = std::min(a.size(), b.size());
            for (size_t i = 0; i < n; ++i) {
                int c = compare(a[i], b[i]);
                if (c != 0) return c;
            }
            return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
        }
        case 6: {
            // Objekte: schlüsselweise in Iterationsreihenfolge
            auto ia = a.begin();
            auto ib = b.begin();
            for (; ia != a.end() && ib != b.end(); ++ia, ++ib) {
                int k = ia.key().compare(ib.key());
                if (k != 0) return k < 0 ? -1 : 1;
                int c = compare(ia.value(), ib.value());
                if (c != 0) return c;
            }
            return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
        }
        default:
            return 0;
    }
}

const json* SelectorMatcher::lookup(const json& doc, std::string_view path) {
    const json* cur = &doc;
    size_t start = 0;
    while (true) {
        if (!cur->is_object()) return nullptr;
        size_t dot = path.find('.', start);
        std::string key(path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start));
        auto it = cur->find(key);
        if (it == cur->end()) return nullptr;
        cur = &*it;
        if (dot == std::string_view::npos) return cur;
        start = dot + 1;
    }
}

bool SelectorMatcher::matchSelector_(const json& selector, const json& doc) {
    if (!selector.is_object()) return false;
    for (auto it = selector.begin(); it != selector.end(); ++it) {
        const std::string& key = it.key();
        const json& cond = it.value();
        if (key == "$and") {
            for (const auto& sub : cond) if (!matchSelector_(sub, doc)) return false;
        } else if (key == "$or") {
            bool any = false;
            for (const auto& sub : cond) {
                if (matchSelector_(sub, doc)) { any = true; break; }
            }
            if (!any) return false;
        } else if (key == "$nor") {
            for (const auto& sub : cond) if (matchSelector_(sub, doc)) return false;
        } else if (key == "$not") {
            if (matchSelector_(cond, doc)) return false;
        } else {
            if (!matchField_(lookup(doc, key), cond)) return false;
        }
    }
    return true;
}

bool SelectorMatcher::matchField_(const json* value, const json& condition) {
    if (!isOperatorObject(condition)) {
        return matchOperator_(value, "$eq", condition);
    }
    for (auto it = condition.begin(); it != condition.end(); ++it) {
        if (!matchOperator_(value, it.key(), it.value())) return false;
    }
    return true;
}

bool SelectorMatcher::matchOperator_(const json* value, const std::string& op, const json& operand) {
    if (op == "$exists") {
        return operand.is_boolean() && (value != nullptr) == operand.get<bool>();
    }
    if (op == "$not") {
        return !matchField_(value, operand);
    }
    if (op == "$ne") {
        return value == nullptr || compare(*value, operand) != 0;
    }
    if (op == "$nin") {
        if (!operand.is_array()) return false;
        if (value == nullptr) return true;
        return std::none_of(operand.begin(), operand.end(),
                            [&](const json& v) { return compare(*value, v) == 0; });
    }

    // Alle uebrigen Operatoren verlangen ein vorhandenes Feld
    if (value == nullptr) return false;

    if (op == "$eq") return compare(*value, operand) == 0;
    if (op == "$in") {
        if (!operand.is_array()) return false;
        return std::any_of(operand.begin(), operand.end(),
                           [&](const json& v) { return compare(*value, v) == 0; });
    }

    // Bereichsvergleiche nur innerhalb derselben Typklasse
    if (typeRank(*value) != typeRank(operand) &&
        !(value->is_boolean() && operand.is_boolean())) {
        return false;
    }
    int c = compare(*value, operand);
    if (op == "$gt") return c > 0;
    if (op == "$gte") return c >= 0;
    if (op == "$lt") return c < 0;
    if (op == "$lte") return c <= 0;
    return false;
}

SelectorMatcher::Status SelectorMatcher::validateSelector_(const json& selector) {
    if (!selector.is_object()) return Status::Error("sub-selector must be an object");
    for (auto it = selector.begin(); it != selector.end(); ++it) {
        const std::string& key = it.key();
        const json& cond = it.value();
        if (key == "$and" || key == "$or" || key == "$nor") {
            if (!cond.is_array()) return Status::Error(key + " requires an array");
            for (const auto& sub : cond) {
                auto st = validateSelector_(sub);
                if (!st.ok) return st;
            }
        } else if (key == "$not") {
            auto st = validateSelector_(cond);
            if (!st.ok) return st;
        } else if (!key.empty() && key[0] == '$') {
            return Status::Error("unknown combinator " + key);
        } else {
            auto st = validateCondition_(key, cond);
            if (!st.ok) return st;
        }
    }
    return Status::OK();
}

SelectorMatcher::Status SelectorMatcher::validateCondition_(const std::string& field, const json& condition) {
    if (!isOperatorObject(condition)) return Status::OK();
    for (auto it = condition.begin(); it != condition.end(); ++it) {
        const std::string& op = it.key();
        if (!isFieldOperator(op)) return Status::Error("unknown operator " + op + " on field " + field);
        if ((op == "$in" || op == "$nin") && !it.value().is_array()) {
            return Status::Error(op + " on field " + field + " requires an array");
        }
        if (op == "$exists" && !it.value().is_boolean()) {
            return Status::Error("$exists on field " + field + " requires a boolean");
        }
        if (op == "$not") {
            auto st = validateCondition_(field, it.value());
            if (!st.ok) return st;
        }
    }
    return Status::OK();
}

} // namespace query
} // namespace docbridge
