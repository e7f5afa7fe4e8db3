/**
 * @file stb_impl.cpp
 * @brief Implementation unit for stb_image (textures) and stb_image_write (output)
 *
 * Exactly one translation unit may define the implementation macros.
 */

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
