#pragma once

#include <stealth/allocator.hpp>
#include <stealth/buffer.hpp>
#include <stealth/command.hpp>
#include <stealth/descriptor.hpp>
#include <stealth/device.hpp>
#include <stealth/error.hpp>
#include <stealth/formats.hpp>
#include <stealth/gpu.hpp>
#include <stealth/instance.hpp>
#include <stealth/launcher.hpp>
#include <stealth/loader.hpp>
#include <stealth/pool.hpp>
#include <stealth/program.hpp>
#include <stealth/rectangle.hpp>
#include <stealth/result.hpp>
#include <stealth/slot_map.hpp>
#include <stealth/texture.hpp>
