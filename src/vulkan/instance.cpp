#include <stealth/instance.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace stealth {

const char* vkResultName(std::int32_t result) {
    switch (static_cast<VkResult>(result)) {
    case VK_SUCCESS:                        return "success";
    case VK_NOT_READY:                      return "not ready";
    case VK_TIMEOUT:                        return "timeout";
    case VK_INCOMPLETE:                     return "incomplete";
    case VK_ERROR_OUT_OF_HOST_MEMORY:       return "out of host memory";
    case VK_ERROR_OUT_OF_DEVICE_MEMORY:     return "out of GPU memory";
    case VK_ERROR_INITIALIZATION_FAILED:    return "initialization failed";
    case VK_ERROR_DEVICE_LOST:              return "device lost (GPU crashed or was removed)";
    case VK_ERROR_MEMORY_MAP_FAILED:        return "memory map failed";
    case VK_ERROR_LAYER_NOT_PRESENT:        return "requested layer not present";
    case VK_ERROR_EXTENSION_NOT_PRESENT:    return "requested extension not present";
    case VK_ERROR_FEATURE_NOT_PRESENT:      return "requested feature not present";
    case VK_ERROR_INCOMPATIBLE_DRIVER:      return "incompatible Vulkan driver";
    case VK_ERROR_TOO_MANY_OBJECTS:         return "too many objects";
    case VK_ERROR_FORMAT_NOT_SUPPORTED:     return "format not supported";
    default:
        return "unknown error";
    }
}

static VKAPI_ATTR VkBool32 VKAPI_CALL DebugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/)
{
    const char* level = "INFO";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
        level = "ERROR";
    else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT)
        level = "WARN";

    std::fprintf(stderr, "[stealth::vulkan] %s: %s\n", level, data->pMessage);
    return VK_FALSE;
}

void Instance::destroy() {
    if (messenger_ != VK_NULL_HANDLE) {
        auto func = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (func) func(instance_, messenger_, nullptr);
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
    }
    instance_  = VK_NULL_HANDLE;
    messenger_ = VK_NULL_HANDLE;
}

Instance::~Instance() {
    destroy();
}

Instance::Instance(Instance&& o) noexcept
    : instance_(o.instance_), messenger_(o.messenger_) {
    o.instance_  = VK_NULL_HANDLE;
    o.messenger_ = VK_NULL_HANDLE;
}

Instance& Instance::operator=(Instance&& o) noexcept {
    if (this != &o) {
        destroy();
        instance_    = o.instance_;
        messenger_   = o.messenger_;
        o.instance_  = VK_NULL_HANDLE;
        o.messenger_ = VK_NULL_HANDLE;
    }
    return *this;
}

static bool nameListed(const char* name, const std::vector<const char*>& list) {
    return std::any_of(list.begin(), list.end(),
                       [&](const char* n) { return std::strcmp(n, name) == 0; });
}

static void deduplicate(std::vector<const char*>& list) {
    std::vector<const char*> unique;
    unique.reserve(list.size());
    for (auto* name : list) {
        if (!nameListed(name, unique)) unique.push_back(name);
    }
    list = std::move(unique);
}

InstanceBuilder& InstanceBuilder::appName(std::string_view name) {
    appName_ = name;
    return *this;
}

InstanceBuilder& InstanceBuilder::requireVulkan(std::uint32_t major,
                                                std::uint32_t minor,
                                                std::uint32_t patch) {
    apiVersion_ = VK_MAKE_API_VERSION(0, major, minor, patch);
    return *this;
}

InstanceBuilder& InstanceBuilder::validation(Validation v) {
    validation_ = v;
    return *this;
}

InstanceBuilder& InstanceBuilder::addExtension(const char* name) {
    extensions_.push_back(name);
    return *this;
}

InstanceBuilder& InstanceBuilder::addLayer(const char* name) {
    layers_.push_back(name);
    return *this;
}

Result<Instance> InstanceBuilder::build() {
    std::vector<const char*> extensions = extensions_;

    bool wantValidation = (validation_ == Validation::On);
    if (wantValidation) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }
    deduplicate(extensions);

    std::uint32_t extCount = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &extCount, nullptr);
    std::vector<VkExtensionProperties> availableExts(extCount);
    vkEnumerateInstanceExtensionProperties(nullptr, &extCount, availableExts.data());

    std::vector<const char*> extNames;
    for (auto& ext : availableExts) extNames.push_back(ext.extensionName);

    std::vector<const char*> layers = layers_;
    if (wantValidation) {
        layers.push_back("VK_LAYER_KHRONOS_validation");
    }
    deduplicate(layers);

    std::uint32_t layerCount = 0;
    vkEnumerateInstanceLayerProperties(&layerCount, nullptr);
    std::vector<VkLayerProperties> availableLayers(layerCount);
    vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data());

    std::vector<const char*> layerNames;
    for (auto& layer : availableLayers) layerNames.push_back(layer.layerName);

    // Degrade gracefully when the validation layer is absent (release driver, CI).
    if (wantValidation && (!nameListed("VK_LAYER_KHRONOS_validation", layerNames) ||
                           !nameListed(VK_EXT_DEBUG_UTILS_EXTENSION_NAME, extNames))) {
        wantValidation = false;
        std::erase_if(layers, [](const char* n) {
            return std::strcmp(n, "VK_LAYER_KHRONOS_validation") == 0;
        });
        std::erase_if(extensions, [](const char* n) {
            return std::strcmp(n, VK_EXT_DEBUG_UTILS_EXTENSION_NAME) == 0;
        });
#ifndef NDEBUG
        std::fprintf(stderr, "[stealth::vulkan] validation layer not available, continuing without\n");
#endif
    }

    for (auto* requested : extensions) {
        if (!nameListed(requested, extNames)) {
            return Error{"create instance", 0,
                         "Extension '" + std::string(requested) + "' is not available.\n"
                         "This usually means your GPU driver doesn't support it.",
                         ErrorKind::Device};
        }
    }
    for (auto* requested : layers) {
        if (!nameListed(requested, layerNames)) {
            return Error{"create instance", 0,
                         "Layer '" + std::string(requested) + "' is not available.\n"
                         "Make sure the Vulkan SDK is installed.",
                         ErrorKind::Device};
        }
    }

    VkApplicationInfo appInfo{};
    appInfo.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName   = appName_.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.pEngineName        = "stealth";
    appInfo.apiVersion         = apiVersion_;

    VkInstanceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo        = &appInfo;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();
    ci.enabledLayerCount       = static_cast<std::uint32_t>(layers.size());
    ci.ppEnabledLayerNames     = layers.data();

    // Chained so validation also covers vkCreateInstance/vkDestroyInstance.
    VkDebugUtilsMessengerCreateInfoEXT debugCI{};
    if (wantValidation) {
        debugCI.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        debugCI.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        debugCI.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                  VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
        debugCI.pfnUserCallback = DebugCallback;
        ci.pNext = &debugCI;
    }

    Instance inst;
    VkResult vr = vkCreateInstance(&ci, nullptr, &inst.instance_);
    if (vr != VK_SUCCESS) {
        std::string msg = vkResultName(vr);
        if (vr == VK_ERROR_INCOMPATIBLE_DRIVER) {
            msg += ": Vulkan " + std::to_string(VK_API_VERSION_MAJOR(apiVersion_)) + "." +
                   std::to_string(VK_API_VERSION_MINOR(apiVersion_)) +
                   " is not supported by the driver";
        }
        return Error{"create instance", static_cast<std::int32_t>(vr), msg, ErrorKind::Device};
    }

    if (wantValidation) {
        auto createFunc = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(inst.instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (createFunc) {
            VkDebugUtilsMessengerCreateInfoEXT messengerCI = debugCI;
            messengerCI.pNext = nullptr;
            createFunc(inst.instance_, &messengerCI, nullptr, &inst.messenger_);
        }
    }

    return inst;
}

Result<std::vector<Adapter>> enumerateAdapters(const Instance& instance) {
    std::uint32_t count = 0;
    VkResult vr = vkEnumeratePhysicalDevices(instance.vkInstance(), &count, nullptr);
    if (vr != VK_SUCCESS) {
        return Error{"enumerate adapters", static_cast<std::int32_t>(vr), vkResultName(vr),
                     ErrorKind::Device};
    }

    std::vector<VkPhysicalDevice> devices(count);
    vr = vkEnumeratePhysicalDevices(instance.vkInstance(), &count, devices.data());
    if (vr != VK_SUCCESS && vr != VK_INCOMPLETE) {
        return Error{"enumerate adapters", static_cast<std::int32_t>(vr), vkResultName(vr),
                     ErrorKind::Device};
    }
    devices.resize(count);

    std::vector<Adapter> adapters;
    adapters.reserve(devices.size());
    for (auto pd : devices) {
        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(pd, &props);
        adapters.push_back(Adapter{
            .instance       = instance.vkInstance(),
            .physicalDevice = pd,
            .name           = props.deviceName,
            .type           = props.deviceType,
            .apiVersion     = props.apiVersion,
        });
    }

    std::stable_sort(adapters.begin(), adapters.end(), [](const Adapter& a, const Adapter& b) {
        return a.type == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU &&
               b.type != VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU;
    });

    return adapters;
}

} // namespace stealth
