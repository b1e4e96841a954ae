#pragma once

#include "codec/image_buffer.hpp"

#include <filesystem>
#include <string>

namespace camkit::codec {

// Writes `image` as binary PPM (P6, maxval 255). RGBA images lose their alpha
// channel. Missing parent directories are created.
bool WritePpm(const std::filesystem::path& path, const ImageBuffer& image, std::string& error);

} // namespace camkit::codec
