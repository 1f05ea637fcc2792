#include "core/profile/ProfileRegistry.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::profile {

    ProfileRegistry::ProfileRegistry(const std::vector<SlicerProfile> &slicerProfiles,
                                     const std::vector<DriverProfile> &driverProfiles) {
        for (const auto &profile: slicerProfiles) {
            if (profile.name.empty()) {
                throw types::ConfigurationException("Slicer profile with empty name");
            }
            if (!slicers_.emplace(profile.name, std::make_shared<const SlicerProfile>(profile)).second) {
                throw types::ConfigurationException("Duplicate slicer profile: " + profile.name);
            }
            Logger::logInfo("[ProfileRegistry] Registered slicer profile " + profile.name + " (" +
                            slicerBackendToString(profile.backend) + ")");
        }

        for (const auto &profile: driverProfiles) {
            if (profile.name.empty()) {
                throw types::ConfigurationException("Driver profile with empty name");
            }
            if (!drivers_.emplace(profile.name, std::make_shared<const DriverProfile>(profile)).second) {
                throw types::ConfigurationException("Duplicate driver profile: " + profile.name);
            }
            Logger::logInfo("[ProfileRegistry] Registered driver profile " + profile.name + " (" +
                            driverBackendToString(profile.backend) + ")");
        }
    }

    std::shared_ptr<const SlicerProfile> ProfileRegistry::resolveSlicer(const std::string &name) const {
        auto it = slicers_.find(name);
        if (it == slicers_.end()) {
            throw types::ProfileNotFoundException(profileKindToString(ProfileKind::SLICER), name);
        }
        return it->second;
    }

    std::shared_ptr<const DriverProfile> ProfileRegistry::resolveDriver(const std::string &name) const {
        auto it = drivers_.find(name);
        if (it == drivers_.end()) {
            throw types::ProfileNotFoundException(profileKindToString(ProfileKind::DRIVER), name);
        }
        return it->second;
    }

    bool ProfileRegistry::contains(ProfileKind kind, const std::string &name) const {
        if (kind == ProfileKind::SLICER) {
            return slicers_.count(name) > 0;
        }
        return drivers_.count(name) > 0;
    }

    std::vector<std::shared_ptr<const SlicerProfile>> ProfileRegistry::slicerProfiles() const {
        std::vector<std::shared_ptr<const SlicerProfile>> result;
        result.reserve(slicers_.size());
        for (const auto &[name, profile]: slicers_) {
            result.push_back(profile);
        }
        return result;
    }

    std::vector<std::shared_ptr<const DriverProfile>> ProfileRegistry::driverProfiles() const {
        std::vector<std::shared_ptr<const DriverProfile>> result;
        result.reserve(drivers_.size());
        for (const auto &[name, profile]: drivers_) {
            result.push_back(profile);
        }
        return result;
    }

} // namespace core::profile
