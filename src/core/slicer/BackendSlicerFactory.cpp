#include "core/slicer/BackendSlicerFactory.hpp"
#include "core/slicer/impl/MiracleGrueSlicer.hpp"
#include "core/slicer/impl/SkeinforgeSlicer.hpp"
#include "core/types/Error.hpp"

namespace core::slicer {

    BackendSlicerFactory::BackendSlicerFactory(SlicerBackendsConfig config)
            : config_(std::move(config)) {
    }

    std::shared_ptr<SlicerAdapter> BackendSlicerFactory::create(profile::SlicerBackend backend) {
        switch (backend) {
            case profile::SlicerBackend::MIRACLE_GRUE:
                return std::make_shared<MiracleGrueSlicer>(config_.miracleGrue, config_.cancelGracePeriod);
            case profile::SlicerBackend::SKEINFORGE:
                return std::make_shared<SkeinforgeSlicer>(config_.skeinforge, config_.cancelGracePeriod);
        }
        throw types::ConveyorException("Unsupported slicer backend: " + profile::slicerBackendToString(backend));
    }

} // namespace core::slicer
