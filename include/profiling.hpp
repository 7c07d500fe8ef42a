#pragma once

/// @file profiling.hpp
/// @brief NVTX ranges for stage-level profiling of the lattice update
///
/// Use with nsys (NVIDIA Nsight Systems) for timeline analysis:
///   nsys profile -t nvtx,openmp ./lbflow_cylinder
///
/// Enabled by configuring with -DLBFLOW_PROFILE_KERNELS=ON, which locates the
/// NVTX headers and defines LBFLOW_PROFILE_KERNELS plus one of
/// LBFLOW_NVTX3 (nvtx3/nvToolsExt.h) or LBFLOW_NVTX_LEGACY (nvToolsExt.h).
///
/// Categories:
///   - STEP (blue): One full time step
///   - MACRO (purple): Density / velocity extraction
///   - COLLIDE (green): Equilibrium and BGK relaxation
///   - STREAM (cyan): Propagation
///   - BC (orange): Boundary handling
///   - IO (magenta): Snapshots and checkpoints

#include <cstdint>

#ifdef LBFLOW_PROFILE_KERNELS

#if defined(LBFLOW_NVTX3)
    #include <nvtx3/nvToolsExt.h>
#else
    #include <nvToolsExt.h>
#endif

// ============================================================================
// Color Definitions (ARGB format)
// ============================================================================
namespace nvtx_colors {
    constexpr uint32_t STEP    = 0xFF3366FF;  // Blue
    constexpr uint32_t MACRO   = 0xFF9966CC;  // Purple
    constexpr uint32_t COLLIDE = 0xFF33CC33;  // Green
    constexpr uint32_t STREAM  = 0xFF00CCCC;  // Cyan
    constexpr uint32_t BC      = 0xFFFF6600;  // Orange
    constexpr uint32_t IO      = 0xFFCC33CC;  // Magenta
}

inline nvtxEventAttributes_t make_nvtx_attr(const char* name, uint32_t color) {
    nvtxEventAttributes_t attr = {0};
    attr.version = NVTX_VERSION;
    attr.size = NVTX_EVENT_ATTRIB_STRUCT_SIZE;
    attr.colorType = NVTX_COLOR_ARGB;
    attr.color = color;
    attr.messageType = NVTX_MESSAGE_TYPE_ASCII;
    attr.message.ascii = name;
    return attr;
}

/// RAII range, pops when the scope exits
struct NvtxColoredScope {
    explicit NvtxColoredScope(const char* name, uint32_t color) {
        nvtxEventAttributes_t attr = make_nvtx_attr(name, color);
        nvtxRangePushEx(&attr);
    }
    ~NvtxColoredScope() { nvtxRangePop(); }
    NvtxColoredScope(const NvtxColoredScope&) = delete;
    NvtxColoredScope& operator=(const NvtxColoredScope&) = delete;
};

#define NVTX_CONCAT_(a, b) a##b
#define NVTX_CONCAT(a, b) NVTX_CONCAT_(a, b)
#define NVTX_UNIQUE_VAR NVTX_CONCAT(nvtx_scope_, __LINE__)

#define NVTX_SCOPE_STEP(name)    NvtxColoredScope NVTX_UNIQUE_VAR(name, nvtx_colors::STEP)
#define NVTX_SCOPE_MACRO(name)   NvtxColoredScope NVTX_UNIQUE_VAR(name, nvtx_colors::MACRO)
#define NVTX_SCOPE_COLLIDE(name) NvtxColoredScope NVTX_UNIQUE_VAR(name, nvtx_colors::COLLIDE)
#define NVTX_SCOPE_STREAM(name)  NvtxColoredScope NVTX_UNIQUE_VAR(name, nvtx_colors::STREAM)
#define NVTX_SCOPE_BC(name)      NvtxColoredScope NVTX_UNIQUE_VAR(name, nvtx_colors::BC)
#define NVTX_SCOPE_IO(name)      NvtxColoredScope NVTX_UNIQUE_VAR(name, nvtx_colors::IO)

#else // !LBFLOW_PROFILE_KERNELS

// ============================================================================
// No-op when profiling disabled
// ============================================================================

#define NVTX_SCOPE_STEP(name)
#define NVTX_SCOPE_MACRO(name)
#define NVTX_SCOPE_COLLIDE(name)
#define NVTX_SCOPE_STREAM(name)
#define NVTX_SCOPE_BC(name)
#define NVTX_SCOPE_IO(name)

#endif // LBFLOW_PROFILE_KERNELS
