#ifndef COCHAN_ALLOCATOR_HPP
#define COCHAN_ALLOCATOR_HPP

#include <mimalloc.h>
#include <cstddef>
#include <memory_resource>

namespace cochan {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void *do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void *p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource &other) const noexcept override;
};

// Global mimalloc-backed PMR resource (singleton). Backs the scheduler's
// task arena and run queue.
std::pmr::memory_resource *mi_resource() noexcept;

namespace detail {

// Coroutine frame allocation, used by every promise type.
void *allocate_frame(std::size_t size);
void deallocate_frame(void *p, std::size_t size) noexcept;

} // namespace detail

} // namespace cochan

#endif // COCHAN_ALLOCATOR_HPP
