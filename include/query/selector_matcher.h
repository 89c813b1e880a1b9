#pragma once

#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace docbridge {
namespace query {

/**
 * Evaluates a Mango-style selector against one JSON document.
 *
 * Supported:
 *   field operators  $eq $ne $gt $gte $lt $lte $in $nin $exists
 *   combinators      $and $or $nor $not
 *   implicit AND of sibling keys, bare values as $eq, dotted field paths
 *
 * Ordering follows CouchDB collation: null < false < true < numbers < strings
 * < arrays < objects. Strings compare bytewise.
 */
class SelectorMatcher {
public:
    struct Status {
        bool ok = true;
        std::string message;
        static Status OK() { return {}; }
        static Status Error(std::string msg) { return Status{false, std::move(msg)}; }
    };

    explicit SelectorMatcher(nlohmann::json selector);

    /// Rejects unknown operators and malformed operand shapes
    Status validate() const;

    bool matches(const nlohmann::json& doc) const;

    /// <0, 0, >0 in collation order
    static int compare(const nlohmann::json& a, const nlohmann::json& b);

    /// Resolve a dotted path ("address.city"); nullptr if absent
    static const nlohmann::json* lookup(const nlohmann::json& doc, std::string_view path);

private:
    static bool matchSelector_(const nlohmann::json& selector, const nlohmann::json& doc);
    static bool matchField_(const nlohmann::json* value, const nlohmann::json& condition);
    static bool matchOperator_(const nlohmann::json* value, const std::string& op, const nlohmann::json& operand);
    static Status validateSelector_(const nlohmann::json& selector);
    static Status validateCondition_(const std::string& field, const nlohmann::json& condition);

    nlohmann::json selector_;
};

} // namespace query
} // namespace docbridge
