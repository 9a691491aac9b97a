#include "kernel/config.hpp"
#include "core/config.hpp"

namespace reverie::kernel {

KernelConfig KernelConfig::from_env() {
    core::config::load_dotenv();

    KernelConfig config;
    long long workers = core::config::get_env_int("REVERIE_WORKERS",
                                                  static_cast<long long>(config.worker_count));
    if (workers > 0) {
        config.worker_count = static_cast<size_t>(workers);
    }
    config.memory = memory::MemoryConfig::from_env();
    return config;
}

} // namespace reverie::kernel
