#pragma once

#include <stealth/descriptor.hpp>

#include <vulkan/vulkan.h>

namespace stealth {

// Device format carrying these samples, VK_FORMAT_UNDEFINED when there is none.
// The single place translating sample encodings to Vulkan.
[[nodiscard]] VkFormat toVkFormat(Samples samples);

} // namespace stealth
