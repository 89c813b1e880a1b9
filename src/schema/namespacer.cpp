#include "schema/namespacer.h"

#include <array>
#include <cctype>
#include <utility>

namespace docbridge {

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Irregular plurals that show up in entity names
constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kIrregular{{
    {"people", "person"},
    {"children", "child"},
    {"men", "man"},
    {"women", "woman"},
    {"indices", "index"},
    {"statuses", "status"},
}};

} // namespace

std::string Namespacer::namespaceOf(std::string_view type_name) {
    auto dot = type_name.rfind('.');
    std::string_view last = (dot == std::string_view::npos) ? type_name : type_name.substr(dot + 1);

    std::string snake = underscore(last);
    auto us = snake.rfind('_');
    if (us == std::string::npos) return singularize(snake);
    return snake.substr(0, us + 1) + singularize(std::string_view(snake).substr(us + 1));
}

std::string Namespacer::qualify(std::string_view ns, std::string_view local_id) {
    if (isQualified(ns, local_id)) return std::string(local_id);
    std::string out;
    out.reserve(ns.size() + 1 + local_id.size());
    out.append(ns);
    out.push_back(SEPARATOR);
    out.append(local_id);
    return out;
}

std::string Namespacer::unqualify(std::string_view ns, std::string_view id) {
    if (isQualified(ns, id)) return std::string(id.substr(ns.size() + 1));
    return std::string(id);
}

std::string Namespacer::baseId(std::string_view id) {
    auto pos = id.find(SEPARATOR);
    if (pos == std::string_view::npos || pos == 0) return std::string(id);
    return std::string(id.substr(pos + 1));
}

bool Namespacer::isQualified(std::string_view ns, std::string_view id) {
    return id.size() > ns.size() && id.compare(0, ns.size(), ns) == 0 && id[ns.size()] == SEPARATOR;
}

std::string Namespacer::scanStartKey(std::string_view ns) {
    return std::string(ns);
}

std::string Namespacer::scanEndKey(std::string_view ns) {
    return std::string(ns) + std::string(SCAN_END_SENTINEL);
}

std::string Namespacer::encodeForTransport(std::string_view id) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(id.size() * 3);
    for (char ch : id) {
        auto c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            out.push_back(ch);
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string Namespacer::decodeFromTransport(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < encoded.size()) {
            int hi = hexValue(encoded[i + 1]);
            int lo = hexValue(encoded[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c); // kaputte Sequenz: unverändert übernehmen
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string Namespacer::underscore(std::string_view camel) {
    std::string out;
    out.reserve(camel.size() + 4);
    for (size_t i = 0; i < camel.size(); ++i) {
        auto c = static_cast<unsigned char>(camel[i]);
        if (c == '-' || c == ' ') {
            out.push_back('_');
            continue;
        }
        if (std::isupper(c)) {
            if (i > 0) {
                auto prev = static_cast<unsigned char>(camel[i - 1]);
                bool nextLower = i + 1 < camel.size() && std::islower(static_cast<unsigned char>(camel[i + 1]));
                if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && nextLower)) {
                    out.push_back('_');
                }
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string Namespacer::singularize(std::string_view word) {
    for (const auto& [plural, singular] : kIrregular) {
        if (word == plural) return std::string(singular);
    }
    if (word.size() > 3 && endsWith(word, "ies")) {
        return std::string(word.substr(0, word.size() - 3)) + "y";
    }
    if (endsWith(word, "sses") || endsWith(word, "xes") || endsWith(word, "ches") || endsWith(word, "shes")) {
        return std::string(word.substr(0, word.size() - 2));
    }
    if (word.size() > 1 && endsWith(word, "s") && !endsWith(word, "ss") && !endsWith(word, "us")) {
        return std::string(word.substr(0, word.size() - 1));
    }
    return std::string(word);
}

} // namespace docbridge
