/**
 * @file container_runtime.cpp
 * @brief Adapter error kind names
 *
 * @date 2025
 */

#include "sandcell/runtime/container_runtime.hpp"

namespace sandcell {
namespace runtime {

const char* AdapterErrorKindName(AdapterErrorKind kind) {
    switch (kind) {
        case AdapterErrorKind::ENGINE_UNAVAILABLE: return "EngineUnavailable";
        case AdapterErrorKind::IMAGE_NOT_FOUND: return "ImageNotFound";
        case AdapterErrorKind::CONTAINER_CREATE_FAILED: return "ContainerCreateFailed";
        case AdapterErrorKind::EXEC_FAILED: return "ExecFailed";
        case AdapterErrorKind::REMOVE_FAILED: return "RemoveFailed";
    }
    return "Unknown";
}

} // namespace runtime
} // namespace sandcell
