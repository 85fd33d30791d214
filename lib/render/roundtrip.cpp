// castlist/render/roundtrip.cpp
#include "castlist/render/roundtrip.hpp"

#include "castlist/render/canonicalizer.hpp"
#include "castlist/syntax/frontend.hpp"

namespace castlist
{

RoundTripReport check_roundtrip(std::string_view input)
{
  RoundTripReport report;
  report.first = render(parse(input));
  report.second = render(parse(report.first));
  report.stable = report.first == report.second;
  return report;
}

}  // namespace castlist
