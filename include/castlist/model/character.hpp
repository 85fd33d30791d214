// castlist/model/character.hpp - Parsed character tree
//
// Characters and fragments are closed sums (std::variant). Consumers visit
// them with an `if constexpr` chain closed by `static_assert(always_false_v)`,
// so adding an alternative fails to compile until every consumer handles it.
//
// All types here are trivially destructible: they are allocated in a
// DatasetArena and point into it.
//
#pragma once

#include <gsl/span>
#include <string_view>
#include <type_traits>
#include <variant>

#include "castlist/basic/source_manager.hpp"

namespace castlist
{

namespace detail
{

template <typename>
inline constexpr bool always_false_v = false;

}  // namespace detail

struct CharacterNode;

// ============================================================================
// Character
// ============================================================================

/**
 * A group member that has no name (it starts with '['). Kept verbatim.
 */
struct RawCharacter
{
  std::string_view raw;
};

/**
 * Either a parsed node (non-owning, arena address is its identity) or a raw
 * malformed member.
 */
using Character = std::variant<const CharacterNode *, RawCharacter>;

// ============================================================================
// Fragments
// ============================================================================

/// Contents of one `(...)`, trimmed. Commas are not split.
struct InfoFragment
{
  std::string_view raw;
};

/// Contents of one `[...]` that is not a group, trimmed.
struct AliasFragment
{
  std::string_view raw;
};

/// A `[...]` holding nested entries. `raw` is for diagnostics only.
struct GroupFragment
{
  std::string_view raw;
  gsl::span<const Character> members;
};

using Fragment = std::variant<InfoFragment, AliasFragment, GroupFragment>;

// ============================================================================
// CharacterNode
// ============================================================================

struct CharacterNode
{
  std::string_view name;  ///< trimmed, never empty
  gsl::span<const Fragment> fragments;
  SourceRange range;  ///< the entry text this node was parsed from
};

/// The node a member refers to, or nullptr for a raw member.
[[nodiscard]] inline const CharacterNode * as_node(const Character & c) noexcept
{
  const auto * const * node = std::get_if<const CharacterNode *>(&c);
  return node != nullptr ? *node : nullptr;
}

/// Kind tag used by dumps and tests ("info", "alias", "group").
[[nodiscard]] inline std::string_view fragment_kind(const Fragment & f) noexcept
{
  return std::visit(
    [](const auto & frag) -> std::string_view {
      using T = std::decay_t<decltype(frag)>;
      if constexpr (std::is_same_v<T, InfoFragment>) {
        return "info";
      } else if constexpr (std::is_same_v<T, AliasFragment>) {
        return "alias";
      } else if constexpr (std::is_same_v<T, GroupFragment>) {
        return "group";
      } else {
        static_assert(detail::always_false_v<T>, "unhandled fragment kind");
      }
    },
    f);
}

/// The literal bracket interior carried by any fragment.
[[nodiscard]] inline std::string_view fragment_raw(const Fragment & f) noexcept
{
  return std::visit([](const auto & frag) { return frag.raw; }, f);
}

}  // namespace castlist
