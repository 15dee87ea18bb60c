#include "ndslice/api.h"

#include "ndslice/rotations.hpp"
#include "ndslice/slice_basis.hpp"

using namespace ndslice;

static_assert(NDSLICE_SLICE_UNIFORM_FLOATS == kSliceUniformFloats, "slice uniform layout mismatch");
static_assert(sizeof(NdsliceRotationAngle) == sizeof(RotationAngle), "rotation angle layout mismatch");

namespace {

ndslice_status_t to_c_status(Status status) {
  return static_cast<ndslice_status_t>(status);
}

Status unpack_slice_uniforms(const float* uniforms, std::size_t dimension, SliceBasis& out) {
  if (uniforms == nullptr) {
    return Status::kNullBuffer;
  }
  if (!valid_dimension(dimension)) {
    return Status::kInvalidDimension;
  }
  out.dimension = dimension;
  VectorN* blocks[] = {&out.basis_x, &out.basis_y, &out.basis_z, &out.origin};
  for (std::size_t block = 0; block < 4; ++block) {
    for (std::size_t axis = 0; axis < kMaxDimension; ++axis) {
      (*blocks[block])[axis] = uniforms[block * kMaxDimension + axis];
    }
  }
  return Status::kSuccess;
}

}  // namespace

extern "C" {

size_t ndslice_rotation_plane_count(size_t dimension) {
  return rotation_plane_count(dimension);
}

ndslice_status_t ndslice_compose_rotation(size_t dimension, const NdsliceRotationAngle* angles, size_t angle_count,
                                          float* out_matrix, size_t out_length) {
  if (out_matrix == nullptr) {
    return NDSLICE_ERROR_NULL_BUFFER;
  }
  if (out_length < dimension * dimension) {
    return NDSLICE_ERROR_BUFFER_TOO_SMALL;
  }

  MatrixN rotation{};
  const Status status =
      compose_rotation(dimension, reinterpret_cast<const RotationAngle*>(angles), angle_count, rotation);
  if (status != Status::kSuccess) {
    return to_c_status(status);
  }

  for (std::size_t row = 0; row < dimension; ++row) {
    for (std::size_t col = 0; col < dimension; ++col) {
      out_matrix[row * dimension + col] = rotation.at(row, col);
    }
  }
  return NDSLICE_OK;
}

float ndslice_orthogonality_drift(const float* matrix, size_t order) {
  if (matrix == nullptr || order == 0 || order > kMaxDimension) {
    return 0.0f;
  }
  MatrixN rotation{};
  rotation.order = order;
  for (std::size_t row = 0; row < order; ++row) {
    for (std::size_t col = 0; col < order; ++col) {
      rotation.at(row, col) = matrix[row * order + col];
    }
  }
  return orthogonality_drift(rotation);
}

ndslice_status_t ndslice_compute_slice_uniforms(size_t dimension, const NdsliceRotationAngle* angles,
                                                size_t angle_count, const float* slice_parameters,
                                                size_t parameter_count, float* out_uniforms, size_t out_length) {
  MatrixN rotation{};
  Status status = compose_rotation(dimension, reinterpret_cast<const RotationAngle*>(angles), angle_count, rotation);
  if (status != Status::kSuccess) {
    return to_c_status(status);
  }

  VectorN origin{};
  status = make_slice_origin(dimension, slice_parameters, parameter_count, origin);
  if (status != Status::kSuccess) {
    return to_c_status(status);
  }

  SliceBasis basis{};
  status = project_slice(rotation, origin, basis);
  if (status != Status::kSuccess) {
    return to_c_status(status);
  }
  return to_c_status(pack_slice_uniforms(basis, BufferView{out_uniforms, out_length}));
}

ndslice_status_t ndslice_project_vertices(const float* slice_uniforms, size_t dimension, const float* vertices,
                                          size_t vertex_count, float* out_positions, size_t out_length) {
  SliceBasis basis{};
  const Status status = unpack_slice_uniforms(slice_uniforms, dimension, basis);
  if (status != Status::kSuccess) {
    return to_c_status(status);
  }
  return to_c_status(project_vertices(basis, ConstBufferView{vertices, dimension * vertex_count}, vertex_count,
                                      BufferView{out_positions, out_length}));
}

const char* ndslice_status_string(ndslice_status_t status) {
  switch (status) {
    case NDSLICE_OK:
      return "Success";
    case NDSLICE_ERROR_INVALID_DIMENSION:
      return "Invalid dimension";
    case NDSLICE_ERROR_INVALID_PLANE:
      return "Invalid rotation plane";
    case NDSLICE_ERROR_DUPLICATE_PLANE:
      return "Duplicate rotation plane";
    case NDSLICE_ERROR_NULL_BUFFER:
      return "Null buffer";
    case NDSLICE_ERROR_BUFFER_TOO_SMALL:
      return "Buffer too small";
    case NDSLICE_ERROR_INVALID_CONFIG:
      return "Invalid configuration";
    case NDSLICE_ERROR_VERSION_MISMATCH:
      return "Snapshot version mismatch";
    default:
      return "Unknown error";
  }
}

}  // extern "C"
