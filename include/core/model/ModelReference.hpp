#pragma once

#include <string>

namespace core::model {

    enum class ModelType {
        STL,
        GCODE,
        UNSUPPORTED
    };

    /**
     * @brief Classification of a submitted model reference (local path or http(s) URL)
     */
    class ModelReference {
    public:
        static bool isRemote(const std::string &reference);

        /**
         * @brief Type by extension, case-insensitive; URL query and fragment are ignored
         */
        static ModelType classify(const std::string &reference);

        /**
         * @brief Last path segment, without any URL query or fragment
         */
        static std::string fileName(const std::string &reference);
    };

} // namespace core::model
