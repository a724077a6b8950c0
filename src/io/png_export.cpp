#include <knotview/export.hpp>
#include <limits>
#include <stb_image_write.h>

namespace knotview
{

bool ImageExporter::write_png(const std::string& path,
                              const uint8_t*     rgba_data,
                              uint32_t           width,
                              uint32_t           height)
{
    constexpr uint32_t channels = 4;
    constexpr uint32_t max_dim  = static_cast<uint32_t>(std::numeric_limits<int>::max()) / channels;

    if (!rgba_data || width == 0 || height == 0 || width > max_dim || height > max_dim)
        return false;

    const int stride = static_cast<int>(width * channels);
    return stbi_write_png(path.c_str(),
                          static_cast<int>(width),
                          static_cast<int>(height),
                          static_cast<int>(channels),
                          rgba_data,
                          stride)
           != 0;
}

}   // namespace knotview
