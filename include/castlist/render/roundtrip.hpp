// castlist/render/roundtrip.hpp - Canonical form stability check
#pragma once

#include <string>
#include <string_view>

namespace castlist
{

struct RoundTripReport
{
  std::string first;   ///< render(parse(input))
  std::string second;  ///< render(parse(first))
  bool stable = false;  ///< first == second
};

/**
 * Parse and render `input` twice and compare the two canonical texts.
 *
 * A stable result means the canonical form is a fixed point for this input.
 * Input with an unclosed group around another unclosed opener is unstable.
 */
[[nodiscard]] RoundTripReport check_roundtrip(std::string_view input);

}  // namespace castlist
