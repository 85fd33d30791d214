// castlist/model/dataset.cpp
#include "castlist/model/dataset.hpp"

#include <algorithm>

namespace castlist
{

size_t Dataset::index_of(const CharacterNode * node) const noexcept
{
  const auto it = std::find(entries_.begin(), entries_.end(), node);
  return static_cast<size_t>(it - entries_.begin());
}

}  // namespace castlist
