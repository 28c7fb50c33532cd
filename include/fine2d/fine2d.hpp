#pragma once

// fine2d - Main include file
// Include this header to access the whole library

// Forward declarations and common types
#include "fine2d/core/types.hpp"

// Core foundation (Layer 1)
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/conf.hpp"
#include "fine2d/core/filesystem.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/debug.hpp"

// Device & Memory Management (Layer 2)
#include "fine2d/device/physical_device.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/memory.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/sampler.hpp"
#include "fine2d/device/command.hpp"

// Rendering Infrastructure (Layer 3)
#include "fine2d/rendering/swapchain.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/rendering/framebuffer.hpp"
#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/rendering/sync.hpp"
#include "fine2d/rendering/descriptors.hpp"

// Window (Layer 4)
#include "fine2d/window/window.hpp"

// 2D graphics (Layer 5)
#include "fine2d/graphics/types.hpp"
#include "fine2d/graphics/matrix_stack.hpp"
#include "fine2d/graphics/sampler_cache.hpp"
#include "fine2d/graphics/texture.hpp"
#include "fine2d/graphics/shader.hpp"
#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/graphics_context.hpp"
#include "fine2d/graphics/image.hpp"
#include "fine2d/graphics/canvas.hpp"
#include "fine2d/graphics/mesh.hpp"
#include "fine2d/graphics/sprite_batch.hpp"
#include "fine2d/graphics/text.hpp"
