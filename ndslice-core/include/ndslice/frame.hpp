#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "ndslice/estimators.hpp"
#include "ndslice/rotations.hpp"
#include "ndslice/slice_basis.hpp"
#include "ndslice/types.hpp"

namespace ndslice {

constexpr std::uint32_t kSnapshotVersion = 1;

// Flat, versioned scene state for share/export. Angles are kept in ascending plane order.
struct SceneSnapshot {
  std::uint32_t version{kSnapshotVersion};
  std::size_t dimension{3};
  std::vector<RotationAngle> angles;
  std::vector<float> slice_parameters;
  EstimatorConfig estimator{};
};

struct FrameUniforms {
  MatrixN rotation{};
  SliceBasis basis{};
  std::array<float, kSliceUniformFloats> packed{};
};

// Owns the inputs of one scene and turns them into per-frame uniforms. Nothing
// is accumulated between frames: update() rebuilds rotation and basis from the
// current angle set every time.
class SliceEngine {
 public:
  explicit SliceEngine(std::size_t dimension = 3, EstimatorFamily family = EstimatorFamily::kHyperbulb);

  // Dimension-change event: drops planes that no longer exist, resizes the
  // slice parameters and re-defaults the estimator for the new dimension.
  Status set_dimension(std::size_t dimension);
  [[nodiscard]] std::size_t dimension() const { return dimension_; }

  Status set_angle(unsigned int i, unsigned int j, float theta);
  Status set_angles(const std::vector<RotationAngle>& angles);
  void clear_angles() { angles_.clear(); }
  [[nodiscard]] const std::vector<RotationAngle>& angles() const { return angles_; }

  Status set_slice_parameter(std::size_t index, float value);
  [[nodiscard]] const std::vector<float>& slice_parameters() const { return slice_parameters_; }

  // Object-type change replaces the config wholesale.
  Status set_estimator_config(const EstimatorConfig& config);
  // Parameter edits and timeline writes go through here.
  [[nodiscard]] EstimatorConfig& estimator_config() { return estimator_; }
  [[nodiscard]] const EstimatorConfig& estimator_config() const { return estimator_; }

  Status update(FrameUniforms& out) const;
  [[nodiscard]] std::unique_ptr<DistanceEstimator> make_estimator(Status* status = nullptr) const;

  [[nodiscard]] SceneSnapshot snapshot() const;
  Status restore(const SceneSnapshot& snapshot);

 private:
  std::size_t dimension_;
  std::vector<RotationAngle> angles_;
  std::vector<float> slice_parameters_;
  EstimatorConfig estimator_;
};

}  // namespace ndslice
