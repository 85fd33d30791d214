// castlist/model/dataset_arena.hpp - Arena allocator and string pool for parsed nodes
//
// This header provides the DatasetArena class which owns all character nodes,
// fragment/member arrays and interned strings of one parse.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace castlist
{

/**
 * Arena that owns everything a Dataset points into.
 *
 * Objects created through the arena live as long as the arena; there is no
 * individual deallocation. A node's address is its identity, which is what
 * flattening and root detection key on.
 *
 * Example:
 * @code
 *   DatasetArena arena;
 *   auto * node = arena.create<CharacterNode>();
 *   auto name = arena.intern("Batman");  // stable string_view
 * @endcode
 */
class DatasetArena
{
public:
  /// Default initial buffer size (16KB)
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit DatasetArena(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~DatasetArena() = default;

  // PMR resources are not movable; Datasets hold the arena by unique_ptr.
  DatasetArena(const DatasetArena &) = delete;
  DatasetArena & operator=(const DatasetArena &) = delete;
  DatasetArena(DatasetArena &&) = delete;
  DatasetArena & operator=(DatasetArena &&) = delete;

  /**
   * Create a new object of type T in the arena.
   *
   * @return Non-owning pointer valid for the arena's lifetime
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Arena objects are never destroyed. "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /**
   * Intern a string and return a stable string_view.
   *
   * Equal strings share storage; the view is valid as long as the arena.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (s.empty()) {
      return {};
    }
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    string_pool_.insert(stored_view);
    return stored_view;
  }

  /**
   * Copy elements from a vector into an arena-allocated array.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    static_assert(std::is_trivially_destructible_v<T>, "Arena arrays are never destroyed.");
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  /// Number of distinct interned strings.
  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace castlist
