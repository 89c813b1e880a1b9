#pragma once

#include <string>
#include <string_view>

namespace docbridge {

/// Namespace and document-id rules for the flat document space
/// All entity types share one key space: "<namespace>/<local_id>"
/// Ids are kept unencoded inside the engine; encodeForTransport is applied
/// only where an id becomes part of a store request path.
class Namespacer {
public:
    /// "Accounts.UserProfiles" -> "user_profile" (last segment, underscored, singular)
    static std::string namespaceOf(std::string_view type_name);

    /// Prefix ns + "/" unless local_id is already qualified with it
    static std::string qualify(std::string_view ns, std::string_view local_id);

    /// Strip a single leading ns + "/" if present
    static std::string unqualify(std::string_view ns, std::string_view id);

    /// Strip any single leading "<segment>/" ("user/1" -> "1", "1" -> "1")
    static std::string baseId(std::string_view id);

    /// True if id starts with ns + "/"
    static bool isQualified(std::string_view ns, std::string_view id);

    /// Lowest and highest key of a namespace for ordered scans
    static std::string scanStartKey(std::string_view ns);
    static std::string scanEndKey(std::string_view ns);

    /// Form-style percent encoding (space -> '+', unreserved A-Za-z0-9-._~ kept)
    static std::string encodeForTransport(std::string_view id);
    static std::string decodeFromTransport(std::string_view encoded);

    static std::string underscore(std::string_view camel);
    static std::string singularize(std::string_view word);

    static constexpr char SEPARATOR = '/';
    static constexpr std::string_view SCAN_END_SENTINEL = "/{}";
};

} // namespace docbridge
