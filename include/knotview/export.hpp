#pragma once

#include <cstdint>
#include <knotview/fwd.hpp>
#include <string>

namespace knotview
{

// Available when built with KNOTVIEW_USE_STB.
class ImageExporter
{
   public:
    static bool write_png(const std::string& path,
                          const uint8_t*     rgba_data,
                          uint32_t           width,
                          uint32_t           height);
};

class SvgExporter
{
   public:
    // Write a Figure to an SVG file. Traverses Figure→Axes→Series and emits
    // SVG elements directly; 3D axes are projected through their camera.
    static bool write_svg(const std::string& path, const Figure& figure);

    // Write SVG to a string instead of a file.
    static std::string to_string(const Figure& figure);
};

}   // namespace knotview
