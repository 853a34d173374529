#pragma once

// Forward-declare VMA handles so public headers do not pull in vk_mem_alloc.h.
struct VmaAllocator_T;
struct VmaAllocation_T;
using VmaAllocator  = VmaAllocator_T*;
using VmaAllocation = VmaAllocation_T*;
