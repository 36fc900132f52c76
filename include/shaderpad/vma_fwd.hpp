#pragma once

// VMA handles without pulling vk_mem_alloc.h into public headers.
struct VmaAllocator_T;
struct VmaAllocation_T;
using VmaAllocator  = VmaAllocator_T*;
using VmaAllocation = VmaAllocation_T*;
