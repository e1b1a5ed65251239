//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include <Dichromat/Utils.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace dm
{

    // Dense row-major grid of pixels. Rows are contiguous, no padding.
    template <class T>
    class Image
    {
    public:
        using PixelType = T;

    public:
        inline int width () const { return _width; }
        inline int height () const { return _height; }

        inline bool hasData () const { return _width>0 && _height>0; }

        inline const T* data () const { return _pixels.data(); }
        inline T* data () { return _pixels.data(); }

        inline T* atRowPtr (int r) { return _pixels.data() + size_t(r)*_width; }
        inline const T* atRowPtr (int r) const { return _pixels.data() + size_t(r)*_width; }

        inline const T& operator()(int c, int r) const { return atRowPtr(r)[c]; }
        inline T& operator()(int c, int r) { return atRowPtr(r)[c]; }

        inline size_t numPixels () const { return _pixels.size(); }
        inline size_t bytesPerRow () const { return _width*sizeof(T); }

    public:
        // Empty image.
        Image () = default;

        // Image with owned buffer, pixels value-initialized.
        Image (int width, int height)
        {
            ensureAllocatedBufferForSize (width, height);
        }

        Image (int width, int height, const T& value)
        : _width (width), _height (height), _pixels (size_t(width)*height, value)
        {
            dm_assert (width >= 0 && height >= 0, "Invalid image size %dx%d", width, height);
        }

        void ensureAllocatedBufferForSize (int width, int height)
        {
            dm_assert (width >= 0 && height >= 0, "Invalid image size %dx%d", width, height);
            _width = width;
            _height = height;
            _pixels.resize (size_t(width)*height);
        }

        void copyDataFrom (const uint8_t* otherData, int otherBytesPerRow, int otherWidth, int otherHeight)
        {
            dm_assert (_width == otherWidth, "Width mismatch");
            dm_assert (_height == otherHeight, "Height mismatch");

            for (int row = 0; row < _height; ++row)
            {
                const T* otherRowPtr = reinterpret_cast<const T*>(otherData + size_t(otherBytesPerRow) * row);
                std::copy (otherRowPtr, otherRowPtr + _width, atRowPtr(row));
            }
        }

        void fill (const T& value)
        {
            std::fill (_pixels.begin(), _pixels.end(), value);
        }

        template <class FuncT>
        void apply (const FuncT& func)
        {
            const int cols = width();
            for (int r = 0; r < height(); ++r)
            {
                auto* rowPtr = atRowPtr(r);
                for (int c = 0; c < cols; ++c)
                {
                    func(c, r, rowPtr[c]);
                }
            }
        }

        bool operator== (const Image& rhs) const
        {
            return _width == rhs._width && _height == rhs._height && _pixels == rhs._pixels;
        }

        bool operator!= (const Image& rhs) const { return !(*this == rhs); }

    private:
        int _width = 0;
        int _height = 0;
        std::vector<T> _pixels;
    };

    template <class T1, class T2>
    inline bool haveSameSize (const Image<T1>& im1, const Image<T2>& im2)
    {
        return im1.width() == im2.width() && im1.height() == im2.height();
    }

    // Builds a new image of the same size by mapping each pixel of the input.
    // The input is never modified.
    template <class OutT, class InT, class FuncT>
    Image<OutT> mapPixels (const Image<InT>& input, const FuncT& func)
    {
        Image<OutT> output (input.width(), input.height());
        for (int r = 0; r < input.height(); ++r)
        {
            const InT* inPtr = input.atRowPtr(r);
            const InT* lastInPtr = inPtr + input.width();
            OutT* outPtr = output.atRowPtr(r);
            while (inPtr != lastInPtr)
            {
                *outPtr = func(*inPtr);
                ++inPtr;
                ++outPtr;
            }
        }
        return output;
    }

    // 8-bit sRGB-encoded storage values in [0,255].
    struct PixelSRGB
    {
        PixelSRGB() = default;

        PixelSRGB (uint8_t r, uint8_t g, uint8_t b)
        : r(r), g(g), b(b)
        {}

        union {
            uint8_t v[3];
            struct {
                uint8_t r;
                uint8_t g;
                uint8_t b;
            };
        };

        inline bool operator== (const PixelSRGB& rhs) const
        {
            return r==rhs.r && g==rhs.g && b==rhs.b;
        }

        inline bool operator!= (const PixelSRGB& rhs) const { return !(*this == rhs); }
    };

    // Shared layout of the floating point color triples. Never used directly:
    // each color space gets its own type below so they cannot be mixed up.
    struct PixelTriplet
    {
        PixelTriplet() = default;

        PixelTriplet (float x, float y, float z)
        : x(x), y(y), z(z)
        {}

        union {
            float v[3];

            struct {
                float x;
                float y;
                float z;
            };

            struct {
                float l;
                float m;
                float s;
            };

            struct {
                float r;
                float g;
                float b;
            };
        };

    protected:
        bool equals (const PixelTriplet& rhs) const {
            return x == rhs.x && y == rhs.y && z == rhs.z;
        }
    };

    // sRGB-encoded values normalized to [0,1].
    struct PixelEncodedRGB : public PixelTriplet
    {
        using PixelTriplet::PixelTriplet;
        bool operator== (const PixelEncodedRGB& rhs) const { return equals(rhs); }
    };

    // Linear RGB, proportional to light intensity. Nominally in [0,1].
    struct PixelLinearRGB : public PixelTriplet
    {
        using PixelTriplet::PixelTriplet;
        bool operator== (const PixelLinearRGB& rhs) const { return equals(rhs); }
    };

    // Long, medium and short wavelength cone responses.
    struct PixelLMS : public PixelTriplet
    {
        using PixelTriplet::PixelTriplet;
        bool operator== (const PixelLMS& rhs) const { return equals(rhs); }
    };

    // Strong types to avoid confusion.
    using ImageSRGB = Image<PixelSRGB>;
    using ImageEncodedRGB = Image<PixelEncodedRGB>;
    using ImageLinearRGB = Image<PixelLinearRGB>;
    using ImageLMS = Image<PixelLMS>;

    // PNG, JPEG, BMP, TGA... Anything stb_image can decode, forced to 3 channels.
    bool readImage (const std::string& inputFileName,
                    ImageSRGB& outputImage);

    bool writePngImage (const std::string& filePath,
                        const ImageSRGB& image);

    // quality in [1,100]
    bool writeJpgImage (const std::string& filePath,
                        const ImageSRGB& image,
                        int quality = 95);

} // dm
