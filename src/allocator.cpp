#include "cochan/allocator.hpp"

#include <new>

namespace cochan {

// --- mi_memory_resource ---

void *mi_memory_resource::do_allocate(std::size_t bytes, std::size_t alignment) {
  void *p = mi_malloc_aligned(bytes, alignment);
  if (!p)
    throw std::bad_alloc();
  return p;
}

void mi_memory_resource::do_deallocate(void *p, std::size_t /*bytes*/,
                                       std::size_t alignment) {
  mi_free_aligned(p, alignment);
}

bool mi_memory_resource::do_is_equal(
    const std::pmr::memory_resource &other) const noexcept {
  return this == &other;
}

// --- Singleton resource ---

static mi_memory_resource g_mi_resource;

std::pmr::memory_resource *mi_resource() noexcept { return &g_mi_resource; }

// --- Coroutine frames ---

namespace detail {

void *allocate_frame(std::size_t size) {
  void *p = mi_malloc(size);
  if (!p)
    throw std::bad_alloc();
  return p;
}

void deallocate_frame(void *p, std::size_t size) noexcept {
  mi_free_size(p, size);
}

} // namespace detail

} // namespace cochan
