// castlist/syntax/parser.cpp - Entry, node and member list parser
#include "castlist/syntax/parser.hpp"

#include <cctype>
#include <cstdint>
#include <string>
#include <utility>

namespace castlist::syntax
{
namespace
{

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string indexed_path(const std::string & base, std::string_view label, size_t index)
{
  std::string out = base;
  out += label;
  out += '[';
  out += std::to_string(index);
  out += ']';
  return out;
}

// Widen the range of a bracket interior to cover the brackets themselves.
SourceRange widen_by_one(SourceRange inner, std::string_view source)
{
  if (inner.is_invalid()) {
    return inner;
  }
  const uint32_t begin = inner.get_begin().get_offset();
  const uint32_t end = inner.get_end().get_offset();
  const auto limit = static_cast<uint32_t>(source.size());
  return {begin > 0 ? begin - 1 : 0, end < limit ? end + 1 : limit};
}

}  // namespace

std::vector<const CharacterNode *> Parser::parse_entries()
{
  ScanContext ctx = scan_context();
  const std::vector<std::string_view> parts =
    split_top_level(source_, k_entry_separator, "input", ctx);

  std::vector<const CharacterNode *> top;
  top.reserve(parts.size());
  for (size_t i = 0; i < parts.size(); ++i) {
    const std::string_view entry = trim(parts[i]);
    if (entry.empty()) {
      continue;
    }
    if (const CharacterNode * node = parse_node(entry, indexed_path("", "top", i))) {
      top.push_back(node);
    }
  }
  return top;
}

const CharacterNode * Parser::parse_node(std::string_view entry, const std::string & path)
{
  size_t i = 0;
  while (i < entry.size() && entry[i] != '[' && entry[i] != '(') {
    ++i;
  }

  const std::string_view name = trim(entry.substr(0, i));
  if (name.empty()) {
    issues_.report(IssueCode::MissingName, entry)
      .with_path(path)
      .with_message("Missing character/group name before fragments.")
      .with_range(range_of(source_, entry));
    return nullptr;
  }

  ScanContext ctx = scan_context();
  std::vector<Fragment> fragments;
  bool seen_info = false;

  while (i < entry.size()) {
    const char c = entry[i];

    if (is_space(c)) {
      ++i;
      continue;
    }

    if (c == '(') {
      const BracketRead r = read_round(entry, i, path, ctx);
      fragments.emplace_back(InfoFragment{arena_.intern(trim(r.inner))});
      seen_info = true;
      i = r.next;
      continue;
    }

    if (c == '[') {
      if (seen_info) {
        const std::string_view rest = entry.substr(i);
        issues_.report(IssueCode::InvalidFragmentOrder, rest)
          .with_path(path)
          .with_message("Found '[' after '()'.")
          .with_range(range_of(source_, rest));
      }
      const BracketRead r = read_square(entry, i, path, ctx);
      fragments.push_back(parse_square_fragment(r.inner, path));
      i = r.next;
      continue;
    }

    // Text between fragments is not part of the name and is dropped.
    ++i;
  }

  return arena_.create<CharacterNode>(CharacterNode{
    arena_.intern(name), arena_.copy_to_arena(fragments), range_of(source_, entry)});
}

Fragment Parser::parse_square_fragment(std::string_view inner, const std::string & path)
{
  // A '[' inside can only come from a nested entity, so the bracket is a
  // group. A top-level ';' alone is not enough to decide.
  const bool has_nested_square = inner.find('[') != std::string_view::npos;

  ScanContext ctx = scan_context();
  bool has_separator = false;
  scan_top_level(inner, path + ".square", ctx, [&has_separator](char c, size_t) {
    if (c == k_entry_separator) {
      has_separator = true;
    }
    return true;
  });

  if (has_nested_square) {
    const std::vector<Character> members =
      parse_member_list(inner, k_entry_separator, path + ".group");
    return GroupFragment{arena_.intern(inner), arena_.copy_to_arena(members)};
  }

  if (has_separator) {
    issues_.report(IssueCode::AmbiguousSquareList, "[" + std::string(inner) + "]")
      .with_path(path)
      .with_message("Could be a group or aliases. Defaulted to alias.")
      .with_range(widen_by_one(range_of(source_, inner), source_));
  }
  return AliasFragment{arena_.intern(trim(inner))};
}

std::vector<Character> Parser::parse_member_list(
  std::string_view inner, char separator, const std::string & path)
{
  ScanContext ctx = scan_context();
  const std::vector<std::string_view> parts = split_top_level(inner, separator, path, ctx);

  std::vector<Character> members;
  for (size_t k = 0; k < parts.size(); ++k) {
    const std::string_view piece = trim(parts[k]);
    if (piece.empty()) {
      continue;
    }
    const std::string member_path = indexed_path(path, "", k);

    if (piece.front() == '[') {
      members.emplace_back(RawCharacter{arena_.intern(piece)});
      issues_.report(IssueCode::InvalidMemberAliasOnly, piece)
        .with_path(member_path)
        .with_message("Member starts with '['; missing name.")
        .with_range(range_of(source_, piece));
      continue;
    }

    // A member without a name was already reported by parse_node.
    if (const CharacterNode * node = parse_node(piece, member_path)) {
      members.emplace_back(node);
    }
  }
  return members;
}

}  // namespace castlist::syntax
