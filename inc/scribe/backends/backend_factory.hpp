#ifndef SCRIBE_BACKEND_FACTORY_HPP
#define SCRIBE_BACKEND_FACTORY_HPP

#include <memory>

#include "engine_backend.hpp"

namespace scribe {

// =============================================================================
// Backend Factory (后端工厂)
// =============================================================================
//
// Part of scribe_whisper, link it to construct the built-in backends.
//

class EngineBackendFactory {
public:
    /// @brief Create a backend, nullptr if the type is not built in
    static std::unique_ptr<IEngineBackend> create(BackendType type);
};

}  // namespace scribe

#endif  // SCRIBE_BACKEND_FACTORY_HPP
