#include "core/model/ModelReference.hpp"

#include <algorithm>
#include <cctype>

namespace core::model {

    namespace {
        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool endsWith(const std::string &value, const std::string &suffix) {
            return value.size() >= suffix.size() &&
                   value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::string stripQuery(const std::string &reference) {
            if (!ModelReference::isRemote(reference)) {
                return reference;
            }
            auto pos = reference.find_first_of("?#");
            return pos == std::string::npos ? reference : reference.substr(0, pos);
        }
    }

    bool ModelReference::isRemote(const std::string &reference) {
        std::string lower = toLower(reference.substr(0, 8));
        return lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0;
    }

    ModelType ModelReference::classify(const std::string &reference) {
        std::string path = toLower(stripQuery(reference));
        if (endsWith(path, ".stl")) return ModelType::STL;
        if (endsWith(path, ".gcode")) return ModelType::GCODE;
        return ModelType::UNSUPPORTED;
    }

    std::string ModelReference::fileName(const std::string &reference) {
        std::string path = stripQuery(reference);
        auto pos = path.find_last_of('/');
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }

} // namespace core::model
