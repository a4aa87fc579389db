#include "scribe/backends/backend_factory.hpp"

#include <memory>

#include "scribe/backends/whisper/whisper_backend.hpp"

namespace scribe {

// =============================================================================
// EngineBackendFactory Implementation
// =============================================================================

std::unique_ptr<IEngineBackend> EngineBackendFactory::create(BackendType type) {
    switch (type) {
        case BackendType::WHISPER:
            return std::make_unique<WhisperBackend>();

        // CUSTOM backends are constructed by the caller and handed to Engine
        case BackendType::CUSTOM:
        default:
            return nullptr;
    }
}

}  // namespace scribe
