// Single translation unit that compiles the Vulkan Memory Allocator implementation
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
