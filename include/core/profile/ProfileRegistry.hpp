#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/profile/Profile.hpp"

namespace core::profile {

    /**
     * @brief Named slicer and driver profiles, built once at startup.
     *
     * Read-only after construction, so lookups need no locking.
     */
    class ProfileRegistry {
    public:
        /**
         * @throws core::types::ConfigurationException on duplicate or empty names
         */
        ProfileRegistry(const std::vector<SlicerProfile> &slicerProfiles,
                        const std::vector<DriverProfile> &driverProfiles);

        /**
         * @throws core::types::ProfileNotFoundException
         */
        std::shared_ptr<const SlicerProfile> resolveSlicer(const std::string &name) const;

        /**
         * @throws core::types::ProfileNotFoundException
         */
        std::shared_ptr<const DriverProfile> resolveDriver(const std::string &name) const;

        bool contains(ProfileKind kind, const std::string &name) const;

        std::vector<std::shared_ptr<const SlicerProfile>> slicerProfiles() const;

        std::vector<std::shared_ptr<const DriverProfile>> driverProfiles() const;

    private:
        std::map<std::string, std::shared_ptr<const SlicerProfile>> slicers_;
        std::map<std::string, std::shared_ptr<const DriverProfile>> drivers_;
    };

} // namespace core::profile
