// castlist/model/dataset.hpp - Result of parsing one input text
#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "castlist/basic/issue.hpp"
#include "castlist/model/character.hpp"
#include "castlist/model/dataset_arena.hpp"

namespace castlist
{

/**
 * Flattened, immutable parse result.
 *
 * `entries()` lists every reachable node exactly once in first-visit,
 * depth-first, left-to-right order; group members appear both inside their
 * group and as entries of their own. `issues()` is the ordered diagnostic
 * log of the parse.
 *
 * The Dataset owns its arena; nodes stay valid for the Dataset's lifetime
 * and across moves.
 */
class Dataset
{
public:
  /// Empty dataset (no entries, no issues)
  Dataset() : arena_(std::make_unique<DatasetArena>()) {}

  Dataset(
    std::unique_ptr<DatasetArena> arena, std::vector<const CharacterNode *> entries,
    IssueBag issues)
  : arena_(std::move(arena)), entries_(std::move(entries)), issues_(std::move(issues))
  {
  }

  Dataset(const Dataset &) = delete;
  Dataset & operator=(const Dataset &) = delete;
  Dataset(Dataset &&) = default;
  Dataset & operator=(Dataset &&) = default;
  ~Dataset() = default;

  [[nodiscard]] const std::vector<const CharacterNode *> & entries() const noexcept
  {
    return entries_;
  }
  [[nodiscard]] const IssueBag & issues() const noexcept { return issues_; }
  [[nodiscard]] const std::vector<ParseIssue> & issues_detailed() const noexcept
  {
    return issues_.all();
  }

  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  /// Index of `node` in entries(), or entries().size() if it is not there.
  [[nodiscard]] size_t index_of(const CharacterNode * node) const noexcept;

private:
  std::unique_ptr<DatasetArena> arena_;
  std::vector<const CharacterNode *> entries_;
  IssueBag issues_;
};

}  // namespace castlist
