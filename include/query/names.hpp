//! # Name Registry
//!
//! The query service does not know CMake's vocabulary itself. It asks a
//! `NameRegistry` for the commands, modules, policies, properties and
//! variables that exist. The CLI fills one from `cmake --help-<kind>-list`;
//! tests and embedders use `StaticNameRegistry`.

#ifndef CMSCRIPT_QUERY_NAMES_HPP
#define CMSCRIPT_QUERY_NAMES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cmscript::query {

/// The kind of a documented CMake name.
enum class NameKind : uint8_t {
    Command,
    Module,
    Policy,
    Property,
    Variable,
};

/// All kinds, in lookup order.
inline constexpr std::array<NameKind, 5> ALL_NAME_KINDS = {
    NameKind::Command, NameKind::Module, NameKind::Policy, NameKind::Property, NameKind::Variable};

/// Returns the lower-case tag used by `cmake --help-<tag>-list`.
[[nodiscard]] auto name_kind_to_string(NameKind kind) -> std::string_view;

/// Parses a tag produced by `name_kind_to_string()`.
[[nodiscard]] auto parse_name_kind(std::string_view tag) -> std::optional<NameKind>;

/// A name with its kind tag.
struct Name {
    std::string name;
    NameKind kind;

    [[nodiscard]] auto operator==(const Name& other) const -> bool = default;
};

/// Source of known names.
class NameRegistry {
public:
    virtual ~NameRegistry() = default;

    /// All names of one kind, in registry order.
    [[nodiscard]] virtual auto names(NameKind kind) const -> std::vector<Name> = 0;

    /// Finds `name` among all kinds, trying kinds in `ALL_NAME_KINDS` order.
    ///
    /// Matching is exact except for commands, which CMake treats
    /// case-insensitively.
    [[nodiscard]] virtual auto find(std::string_view name) const -> std::optional<Name>;
};

/// In-memory registry.
class StaticNameRegistry : public NameRegistry {
public:
    StaticNameRegistry() = default;

    /// Adds a name. Duplicates of the same kind are ignored.
    void add(std::string name, NameKind kind);

    /// Adds every non-empty line of `listing` as a name of `kind`, the
    /// format printed by `cmake --help-<kind>-list`.
    void add_listing(std::string_view listing, NameKind kind);

    [[nodiscard]] auto names(NameKind kind) const -> std::vector<Name> override;

    [[nodiscard]] auto size() const -> size_t;

private:
    std::unordered_map<NameKind, std::vector<Name>> names_;
};

} // namespace cmscript::query

#endif // CMSCRIPT_QUERY_NAMES_HPP
