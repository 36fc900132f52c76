#pragma once

#include <shaderpad/error.hpp>
#include <shaderpad/result.hpp>
#include <shaderpad/config.hpp>
#include <shaderpad/util.hpp>

#include <shaderpad/app.hpp>
#include <shaderpad/window.hpp>

#include <shaderpad/instance.hpp>
#include <shaderpad/surface.hpp>
#include <shaderpad/device.hpp>
#include <shaderpad/swapchain.hpp>
#include <shaderpad/frames.hpp>
#include <shaderpad/allocator.hpp>
#include <shaderpad/buffer.hpp>
#include <shaderpad/descriptor_set.hpp>
#include <shaderpad/barriers.hpp>
#include <shaderpad/pipeline.hpp>

#include <shaderpad/shader_compiler.hpp>
#include <shaderpad/shader_reflect.hpp>
#include <shaderpad/shader_pipeline.hpp>

#include <shaderpad/geometry.hpp>
#include <shaderpad/uniforms.hpp>
#include <shaderpad/uniform_binding.hpp>
#include <shaderpad/hot_swap.hpp>
#include <shaderpad/frame_input.hpp>
#include <shaderpad/frame_error.hpp>
#include <shaderpad/render_state.hpp>
#include <shaderpad/driver.hpp>
