#include "query/names.hpp"

#include <algorithm>
#include <cctype>

namespace cmscript::query {

auto name_kind_to_string(NameKind kind) -> std::string_view {
    switch (kind) {
    case NameKind::Command:
        return "command";
    case NameKind::Module:
        return "module";
    case NameKind::Policy:
        return "policy";
    case NameKind::Property:
        return "property";
    case NameKind::Variable:
        return "variable";
    }
    return "unknown";
}

auto parse_name_kind(std::string_view tag) -> std::optional<NameKind> {
    for (auto kind : ALL_NAME_KINDS) {
        if (name_kind_to_string(kind) == tag) {
            return kind;
        }
    }
    return std::nullopt;
}

static auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

auto NameRegistry::find(std::string_view name) const -> std::optional<Name> {
    for (auto kind : ALL_NAME_KINDS) {
        for (auto& candidate : names(kind)) {
            bool match = kind == NameKind::Command ? equals_ignore_case(candidate.name, name)
                                                   : candidate.name == name;
            if (match) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

void StaticNameRegistry::add(std::string name, NameKind kind) {
    auto& bucket = names_[kind];
    auto exists = std::any_of(bucket.begin(), bucket.end(),
                              [&name](const Name& n) { return n.name == name; });
    if (!exists) {
        bucket.push_back(Name{.name = std::move(name), .kind = kind});
    }
}

void StaticNameRegistry::add_listing(std::string_view listing, NameKind kind) {
    size_t start = 0;
    while (start <= listing.size()) {
        auto end = listing.find('\n', start);
        if (end == std::string_view::npos) {
            end = listing.size();
        }
        auto line = listing.substr(start, end - start);
        auto first = line.find_first_not_of(" \t\r");
        if (first != std::string_view::npos) {
            auto last = line.find_last_not_of(" \t\r");
            add(std::string(line.substr(first, last - first + 1)), kind);
        }
        start = end + 1;
    }
}

auto StaticNameRegistry::names(NameKind kind) const -> std::vector<Name> {
    auto it = names_.find(kind);
    if (it == names_.end()) {
        return {};
    }
    return it->second;
}

auto StaticNameRegistry::size() const -> size_t {
    size_t total = 0;
    for (const auto& [_, bucket] : names_) {
        total += bucket.size();
    }
    return total;
}

} // namespace cmscript::query
