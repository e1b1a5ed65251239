//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Image.h"
#include "Utils.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace dm {

    bool readImage (const std::string& inputFileName, ImageSRGB& outputImage)
    {
        int width = -1, height = -1, channels = -1;
        uint8_t* data = stbi_load(inputFileName.c_str(), &width, &height, &channels, 3);
        if (!data)
        {
            dm_dbg ("Could not decode %s: %s", inputFileName.c_str(), stbi_failure_reason());
            return false;
        }

        dm_dbg ("Loaded %s (%dx%d, %d channels in file)", inputFileName.c_str(), width, height, channels);

        outputImage.ensureAllocatedBufferForSize (width, height);
        outputImage.copyDataFrom (data, width*3, width, height);
        stbi_image_free (data);
        return true;
    }

    bool writePngImage (const std::string& filePath, const ImageSRGB& image)
    {
        return stbi_write_png(filePath.c_str(), image.width(), image.height(), 3, image.data(), (int)image.bytesPerRow()) != 0;
    }

    bool writeJpgImage (const std::string& filePath, const ImageSRGB& image, int quality)
    {
        dm_assert (quality >= 1 && quality <= 100, "Invalid JPEG quality %d", quality);
        return stbi_write_jpg(filePath.c_str(), image.width(), image.height(), 3, image.data(), quality) != 0;
    }

} // dm
