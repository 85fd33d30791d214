// castlist/render/canonicalizer.cpp - Canonical text rendering
#include "castlist/render/canonicalizer.hpp"

#include <type_traits>
#include <variant>

#include "castlist/syntax/bracket_scanner.hpp"

namespace castlist
{
namespace
{

void append_fragment(std::string & out, const Fragment & fragment)
{
  std::visit(
    [&out](const auto & f) {
      using T = std::decay_t<decltype(f)>;
      if constexpr (std::is_same_v<T, InfoFragment>) {
        out += " (";
        out += syntax::trim(f.raw);
        out += ')';
      } else if constexpr (std::is_same_v<T, AliasFragment>) {
        out += " [";
        out += syntax::trim(f.raw);
        out += ']';
      } else if constexpr (std::is_same_v<T, GroupFragment>) {
        // Groups are rebuilt from members; f.raw is never used here.
        out += " [";
        bool first = true;
        for (const Character & member : f.members) {
          if (!first) {
            out += "; ";
          }
          first = false;
          out += render_character(member);
        }
        out += ']';
      } else {
        static_assert(detail::always_false_v<T>, "unhandled fragment kind");
      }
    },
    fragment);
}

}  // namespace

std::unordered_set<const CharacterNode *> collect_members(const Dataset & dataset)
{
  std::unordered_set<const CharacterNode *> children;
  for (const CharacterNode * node : dataset.entries()) {
    for (const Fragment & f : node->fragments) {
      const auto * group = std::get_if<GroupFragment>(&f);
      if (group == nullptr) {
        continue;
      }
      for (const Character & member : group->members) {
        if (const CharacterNode * child = as_node(member)) {
          children.insert(child);
        }
      }
    }
  }
  return children;
}

std::vector<const CharacterNode *> find_roots(const Dataset & dataset)
{
  const auto children = collect_members(dataset);
  std::vector<const CharacterNode *> roots;
  for (const CharacterNode * node : dataset.entries()) {
    if (children.count(node) == 0) {
      roots.push_back(node);
    }
  }
  return roots;
}

std::string render_character(const Character & character)
{
  return std::visit(
    [](const auto & c) -> std::string {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, const CharacterNode *>) {
        return render_node(*c);
      } else if constexpr (std::is_same_v<T, RawCharacter>) {
        return std::string(syntax::trim(c.raw));
      } else {
        static_assert(detail::always_false_v<T>, "unhandled character kind");
      }
    },
    character);
}

std::string render_node(const CharacterNode & node)
{
  std::string out(syntax::trim(node.name));
  for (const Fragment & f : node.fragments) {
    append_fragment(out, f);
  }
  return out;
}

std::string render(const Dataset & dataset)
{
  const auto roots = find_roots(dataset);
  std::string out;
  for (size_t i = 0; i < roots.size(); ++i) {
    if (i > 0) {
      out += "; ";
    }
    out += render_node(*roots[i]);
  }
  if (!roots.empty()) {
    out += ';';
  }
  return out;
}

}  // namespace castlist
