#include "ndslice/frame.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace ndslice {

namespace {

bool plane_less(const RotationAngle& a, const RotationAngle& b) {
  return a.i != b.i ? a.i < b.i : a.j < b.j;
}

std::size_t slice_parameter_count(std::size_t dimension) {
  return dimension > 3 ? dimension - 3 : 0;
}

}  // namespace

SliceEngine::SliceEngine(std::size_t dimension, EstimatorFamily family)
    : dimension_(valid_dimension(dimension) ? dimension : 3),
      slice_parameters_(slice_parameter_count(dimension_), 0.0f),
      estimator_(default_estimator_config(family, dimension_)) {
  if (dimension_ != dimension) {
    spdlog::warn("SliceEngine: dimension {} outside [{}, {}], using {}", dimension, kMinDimension, kMaxDimension,
                 dimension_);
  }
}

Status SliceEngine::set_dimension(std::size_t dimension) {
  if (!valid_dimension(dimension)) {
    spdlog::warn("SliceEngine: rejected dimension {}", dimension);
    return Status::kInvalidDimension;
  }
  if (dimension == dimension_) {
    return Status::kSuccess;
  }

  angles_.erase(std::remove_if(angles_.begin(), angles_.end(),
                               [dimension](const RotationAngle& angle) { return angle.j >= dimension; }),
                angles_.end());
  slice_parameters_.resize(slice_parameter_count(dimension), 0.0f);
  estimator_ = default_estimator_config(estimator_.family, dimension);
  dimension_ = dimension;
  return Status::kSuccess;
}

Status SliceEngine::set_angle(unsigned int i, unsigned int j, float theta) {
  if (i >= j || j >= dimension_) {
    spdlog::warn("SliceEngine: rejected rotation plane ({}, {}) in {}D", i, j, dimension_);
    return Status::kInvalidPlane;
  }

  const RotationAngle angle{i, j, sanitize_angle(theta)};
  auto it = std::lower_bound(angles_.begin(), angles_.end(), angle, plane_less);
  if (it != angles_.end() && it->i == i && it->j == j) {
    it->theta = angle.theta;
  } else {
    angles_.insert(it, angle);
  }
  return Status::kSuccess;
}

Status SliceEngine::set_angles(const std::vector<RotationAngle>& angles) {
  // Validate the whole set before touching state
  MatrixN scratch{};
  const Status status = compose_rotation(dimension_, angles.data(), angles.size(), scratch);
  if (status != Status::kSuccess) {
    spdlog::warn("SliceEngine: rejected angle set of {} planes in {}D", angles.size(), dimension_);
    return status;
  }

  angles_ = angles;
  for (RotationAngle& angle : angles_) {
    angle.theta = sanitize_angle(angle.theta);
  }
  std::sort(angles_.begin(), angles_.end(), plane_less);
  return Status::kSuccess;
}

Status SliceEngine::set_slice_parameter(std::size_t index, float value) {
  if (index >= slice_parameters_.size()) {
    return Status::kInvalidPlane;
  }
  slice_parameters_[index] = std::isfinite(value) ? value : 0.0f;
  return Status::kSuccess;
}

Status SliceEngine::set_estimator_config(const EstimatorConfig& config) {
  const Status status = validate_estimator_config(config);
  if (status != Status::kSuccess) {
    spdlog::warn("SliceEngine: rejected {} estimator config", family_name(config.family));
    return status;
  }
  if (config.dimension != dimension_) {
    spdlog::warn("SliceEngine: estimator dimension {} does not match scene dimension {}", config.dimension,
                 dimension_);
    return Status::kInvalidDimension;
  }
  estimator_ = config;
  return Status::kSuccess;
}

Status SliceEngine::update(FrameUniforms& out) const {
  Status status = compose_rotation(dimension_, angles_.data(), angles_.size(), out.rotation);
  if (status != Status::kSuccess) {
    return status;
  }

  VectorN origin{};
  status = make_slice_origin(dimension_, slice_parameters_.data(), slice_parameters_.size(), origin);
  if (status != Status::kSuccess) {
    return status;
  }

  status = project_slice(out.rotation, origin, out.basis);
  if (status != Status::kSuccess) {
    return status;
  }
  return pack_slice_uniforms(out.basis, BufferView{out.packed.data(), out.packed.size()});
}

std::unique_ptr<DistanceEstimator> SliceEngine::make_estimator(Status* status) const {
  return ndslice::make_estimator(estimator_, status);
}

SceneSnapshot SliceEngine::snapshot() const {
  SceneSnapshot snapshot{};
  snapshot.dimension = dimension_;
  snapshot.angles = angles_;
  snapshot.slice_parameters = slice_parameters_;
  snapshot.estimator = estimator_;
  return snapshot;
}

Status SliceEngine::restore(const SceneSnapshot& snapshot) {
  if (snapshot.version != kSnapshotVersion) {
    spdlog::warn("SliceEngine: snapshot version {} not supported (expected {})", snapshot.version,
                 kSnapshotVersion);
    return Status::kVersionMismatch;
  }
  if (!valid_dimension(snapshot.dimension)) {
    return Status::kInvalidDimension;
  }
  if (snapshot.slice_parameters.size() != slice_parameter_count(snapshot.dimension) ||
      snapshot.estimator.dimension != snapshot.dimension) {
    return Status::kInvalidConfig;
  }

  MatrixN scratch{};
  Status status = compose_rotation(snapshot.dimension, snapshot.angles.data(), snapshot.angles.size(), scratch);
  if (status != Status::kSuccess) {
    return status;
  }
  status = validate_estimator_config(snapshot.estimator);
  if (status != Status::kSuccess) {
    return status;
  }

  dimension_ = snapshot.dimension;
  angles_ = snapshot.angles;
  for (RotationAngle& angle : angles_) {
    angle.theta = sanitize_angle(angle.theta);
  }
  std::sort(angles_.begin(), angles_.end(), plane_less);
  slice_parameters_ = snapshot.slice_parameters;
  estimator_ = snapshot.estimator;
  return Status::kSuccess;
}

}  // namespace ndslice
