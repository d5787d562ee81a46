#include "vqeval/core/Backend.hpp"
#include "cpu/CpuBackend.hpp"
#include <stdexcept>
#include <memory>

namespace vqeval {

std::unique_ptr<IMetricBackend> makeBackend(BackendType type)
{
    switch (type) {
        case BackendType::CPU:
            return std::make_unique<CpuBackend>();
    }
    throw std::invalid_argument("Requested metric backend is unknown");
}

} // namespace vqeval
