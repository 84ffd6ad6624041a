/*
 * This file is part of bezflat, a cubic bezier curve flattening toolkit
 * Copyright (C) 2024 The bezflat authors
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 * 
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

template <typename T>
constexpr T ipow(T num, unsigned int pow)
{
    return (pow >= sizeof(unsigned int)*8) ? 0 :
        pow == 0 ? 1 : num * ipow(num, pow-1);
}

/* Fixed-point scale of clipper's integer coordinates. Coordinates are in mm, so this is 0.1nm resolution. */
constexpr int CLIPPER_PRECISION = 7;
constexpr double clipper_scale = ipow(10.0, CLIPPER_PRECISION);
