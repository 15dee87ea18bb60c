#include "ndslice/slice_basis.hpp"

#include <cstddef>

namespace ndslice {

namespace {

void rotate_vector(const MatrixN& rotation, const VectorN& input, VectorN& out) {
  out.fill(0.0f);
  for (std::size_t row = 0; row < rotation.order; ++row) {
    float sum = 0.0f;
    for (std::size_t col = 0; col < rotation.order; ++col) {
      sum += rotation.at(row, col) * input[col];
    }
    out[row] = sum;
  }
}

// R e_k is column k of R
void rotated_axis(const MatrixN& rotation, std::size_t axis, VectorN& out) {
  out.fill(0.0f);
  if (axis >= rotation.order) {
    return;
  }
  for (std::size_t row = 0; row < rotation.order; ++row) {
    out[row] = rotation.at(row, axis);
  }
}

}  // namespace

Status make_slice_origin(std::size_t dimension, const float* parameters, std::size_t parameter_count, VectorN& out) {
  if (!valid_dimension(dimension)) {
    return Status::kInvalidDimension;
  }
  out.fill(0.0f);
  if (parameter_count == 0 || dimension <= 3) {
    return Status::kSuccess;
  }
  if (parameters == nullptr) {
    return Status::kNullBuffer;
  }
  for (std::size_t axis = 3; axis < dimension && axis - 3 < parameter_count; ++axis) {
    out[axis] = parameters[axis - 3];
  }
  return Status::kSuccess;
}

Status project_slice(const MatrixN& rotation, const VectorN& origin, SliceBasis& out) {
  if (!valid_dimension(rotation.order)) {
    return Status::kInvalidDimension;
  }

  out.dimension = rotation.order;
  rotated_axis(rotation, 0, out.basis_x);
  rotated_axis(rotation, 1, out.basis_y);
  rotated_axis(rotation, 2, out.basis_z);
  rotate_vector(rotation, origin, out.origin);
  return Status::kSuccess;
}

void map_to_nd(const SliceBasis& basis, float x, float y, float z, float* out_point) {
  if (out_point == nullptr) {
    return;
  }
  for (std::size_t axis = 0; axis < basis.dimension; ++axis) {
    out_point[axis] = basis.origin[axis] + x * basis.basis_x[axis] + y * basis.basis_y[axis] + z * basis.basis_z[axis];
  }
}

Status project_vertices(const SliceBasis& basis, ConstBufferView vertices, std::size_t vertex_count,
                        BufferView out_positions) {
  if (vertices.data == nullptr || out_positions.data == nullptr) {
    return Status::kNullBuffer;
  }
  const std::size_t dimension = basis.dimension;
  if (!valid_dimension(dimension)) {
    return Status::kInvalidDimension;
  }
  if (vertices.length < dimension * vertex_count || out_positions.length < vertex_count * 3) {
    return Status::kBufferTooSmall;
  }

  VectorN offset{};
  for (std::size_t vertex = 0; vertex < vertex_count; ++vertex) {
    for (std::size_t axis = 0; axis < dimension; ++axis) {
      offset[axis] = vertices.data[axis * vertex_count + vertex] - basis.origin[axis];
    }

    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    for (std::size_t axis = 0; axis < dimension; ++axis) {
      x += offset[axis] * basis.basis_x[axis];
      y += offset[axis] * basis.basis_y[axis];
      z += offset[axis] * basis.basis_z[axis];
    }

    out_positions.data[vertex * 3 + 0] = x;
    out_positions.data[vertex * 3 + 1] = y;
    out_positions.data[vertex * 3 + 2] = z;
  }
  return Status::kSuccess;
}

Status pack_slice_uniforms(const SliceBasis& basis, BufferView out) {
  if (out.data == nullptr) {
    return Status::kNullBuffer;
  }
  if (out.length < kSliceUniformFloats) {
    return Status::kBufferTooSmall;
  }

  const VectorN* blocks[] = {&basis.basis_x, &basis.basis_y, &basis.basis_z, &basis.origin};
  for (std::size_t block = 0; block < 4; ++block) {
    float* dst = out.data + block * kMaxDimension;
    for (std::size_t axis = 0; axis < kMaxDimension; ++axis) {
      dst[axis] = axis < basis.dimension ? (*blocks[block])[axis] : 0.0f;
    }
  }
  return Status::kSuccess;
}

}  // namespace ndslice
