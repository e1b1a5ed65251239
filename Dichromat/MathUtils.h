//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace dm
{

    // Row-major 3x3 matrix, used for the fixed color transforms.
    struct Matrix3f
    {
        union {
            float v[3*3];

            // mRowCol
            struct {
                float m00, m01, m02;
                float m10, m11, m12;
                float m20, m21, m22;
            };
        };

        Matrix3f() = default;

        Matrix3f(float m00, float m01, float m02,
                 float m10, float m11, float m12,
                 float m20, float m21, float m22)
        : m00(m00), m01(m01), m02(m02),
          m10(m10), m11(m11), m12(m12),
          m20(m20), m21(m21), m22(m22)
        {

        }

        static Matrix3f identity ()
        {
            return Matrix3f(1, 0, 0,
                            0, 1, 0,
                            0, 0, 1);
        }

        float operator() (int row, int col) const { return v[row*3 + col]; }
    };

    inline Matrix3f operator* (const Matrix3f& lhs, const Matrix3f& rhs)
    {
        Matrix3f out;
        for (int r = 0; r < 3; ++r)
            for (int c = 0; c < 3; ++c)
            {
                double sum = 0.;
                for (int k = 0; k < 3; ++k)
                    sum += double(lhs(r,k)) * rhs(k,c);
                out.v[r*3 + c] = float(sum);
            }
        return out;
    }

    // Largest absolute elementwise difference.
    inline float maxAbsDifference (const Matrix3f& lhs, const Matrix3f& rhs)
    {
        float maxDiff = 0.f;
        for (int i = 0; i < 9; ++i)
            maxDiff = std::max (maxDiff, std::abs(lhs.v[i] - rhs.v[i]));
        return maxDiff;
    }

    // out = m * (x, y, z)^T
    template <class InT, class OutT>
    inline void multiply (const Matrix3f& m, const InT& in, OutT& out)
    {
        const float x = in.v[0];
        const float y = in.v[1];
        const float z = in.v[2];
        out.v[0] = m.m00*x + m.m01*y + m.m02*z;
        out.v[1] = m.m10*x + m.m11*y + m.m12*z;
        out.v[2] = m.m20*x + m.m21*y + m.m22*z;
    }

    // Truncates toward zero after saturating to [0,255].
    inline uint8_t saturateAndCastToUint8 (float v)
    {
        return (uint8_t)std::max (std::min(v, 255.f), 0.f);
    };

    template <class T>
    T keepInRange (T value, T min, T max)
    {
        if (value < min)
            return min;
        if (value > max)
            return max;
        return value;
    }

} // dm
