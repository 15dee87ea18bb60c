#pragma once

#include <cstddef>

#include "ndslice/types.hpp"

namespace ndslice {

struct SliceBasis {
  std::size_t dimension{0};
  VectorN origin{};
  VectorN basis_x{};
  VectorN basis_y{};
  VectorN basis_z{};
};

// Four zero-padded float[kMaxDimension] arrays: uBasisX, uBasisY, uBasisZ, uOrigin
constexpr std::size_t kSliceUniformFloats = 4 * kMaxDimension;

// origin = [0, 0, 0, p0, p1, ...]; parameters fill axes 3..dimension-1 and any
// surplus is ignored.
Status make_slice_origin(std::size_t dimension, const float* parameters, std::size_t parameter_count, VectorN& out);

// basis_x = R e0, basis_y = R e1, basis_z = R e2, origin = R origin.
// For dimension 2 there is no e2 and basis_z is the zero vector.
Status project_slice(const MatrixN& rotation, const VectorN& origin, SliceBasis& out);

// pointND = origin + x basis_x + y basis_y + z basis_z
void map_to_nd(const SliceBasis& basis, float x, float y, float z, float* out_point);

// Inverse of map_to_nd for points in the slice: out = ((v - origin) . basis_{x,y,z}).
// vertices are structure-of-arrays, axis-major: dimension * vertex_count floats.
Status project_vertices(const SliceBasis& basis, ConstBufferView vertices, std::size_t vertex_count,
                        BufferView out_positions);

Status pack_slice_uniforms(const SliceBasis& basis, BufferView out);

}  // namespace ndslice
