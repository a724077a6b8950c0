#pragma once

#include <cstdint>
#include <knotview/logger.hpp>
#include <string>

namespace knotview
{

struct RenderConfig
{
    // Where svg/png artifacts are written, as <output_dir>/<output_prefix>-<n>.<ext>
    std::string output_dir    = ".";
    std::string output_prefix = "knotview";

    uint32_t width       = 1280;
    uint32_t height      = 720;
    int      tube_points = 8;   // sides of the tube cross-section

    LogLevel    log_level = LogLevel::Info;
    std::string log_file;   // empty = console only

    // Defaults overridden by KNOTVIEW_OUTPUT_DIR, KNOTVIEW_OUTPUT_PREFIX,
    // KNOTVIEW_WIDTH, KNOTVIEW_HEIGHT, KNOTVIEW_TUBE_POINTS, KNOTVIEW_LOG_LEVEL
    // and KNOTVIEW_LOG_FILE. Malformed values are logged and ignored.
    static RenderConfig from_env();

    // Next free artifact path for this process; the counter is shared by all
    // backends so files never collide.
    std::string next_output_path(const std::string& extension) const;
};

// Installs the console sink (and a file sink when log_file is set) and
// applies log_level. Safe to call more than once; sinks are replaced.
void init_logging(const RenderConfig& config);

}   // namespace knotview
