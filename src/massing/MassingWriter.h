#pragma once

// JSON massing document for the geometry generator

#include "MassingConfig.h"
#include "MassingPipeline.h"
#include <nlohmann/json.hpp>
#include <string>

namespace massing {

class MassingWriter {
public:
    static nlohmann::json toJson(const MassingRun& run, const MassingConfig& config);

    static bool save(const std::string& path, const MassingRun& run, const MassingConfig& config);
};

} // namespace massing
