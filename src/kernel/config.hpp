#pragma once
#include <cstddef>
#include "memory/config.hpp"

namespace reverie::kernel {

// Kernel configuration
struct KernelConfig {
    size_t worker_count = 2;             // async syscall workers
    memory::MemoryConfig memory;

    // .env and REVERIE_* overrides (REVERIE_WORKERS plus the memory keys).
    static KernelConfig from_env();
};

} // namespace reverie::kernel
