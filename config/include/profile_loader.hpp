#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "profile.hpp"

namespace config {

    using json = nlohmann::json;

    // Reads and writes named profiles. Missing keys keep their defaults,
    // keys of the wrong type and invalid values throw core::ConfigException.
    class ProfileLoader {
    public:
        static Profile fromJson(const json& config);
        static Profile fromFile(const std::string& path);
        static json toJson(const Profile& profile);
    };

} // namespace config
