#include <array>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "ndslice/api.h"
#include "ndslice/estimators.hpp"
#include "ndslice/frame.hpp"
#include "ndslice/raymarch.hpp"
#include "ndslice/rotations.hpp"
#include "ndslice/slice_basis.hpp"
#include "ndslice/types.hpp"

namespace {
constexpr float kEpsilon = 1e-5f;
constexpr float kQuarterPi = 0.78539816339f;
constexpr float kHalfPi = 1.57079632679f;

float absolute(float value) {
  return value < 0.0f ? -value : value;
}

bool approx_equal(float a, float b, float eps = kEpsilon) {
  return absolute(a - b) <= eps;
}

float length(const ndslice::VectorN& v) {
  float sum = 0.0f;
  for (float component : v) {
    sum += component * component;
  }
  return std::sqrt(sum);
}
}  // namespace

int main() {
  {
    assert(ndslice::rotation_plane_count(2) == 1);
    assert(ndslice::rotation_plane_count(3) == 3);
    assert(ndslice::rotation_plane_count(4) == 6);
    assert(ndslice::rotation_plane_count(11) == 55);

    for (std::size_t dimension = 2; dimension <= ndslice::kMaxDimension; ++dimension) {
      const std::size_t count = ndslice::rotation_plane_count(dimension);
      for (std::size_t index = 0; index < count; ++index) {
        unsigned int i = 0;
        unsigned int j = 0;
        assert(ndslice::rotation_plane_at(index, dimension, i, j) == ndslice::Status::kSuccess);
        assert(i < j && j < dimension);
        assert(ndslice::rotation_plane_index(i, j, dimension) == index);
      }
      assert(ndslice::rotation_plane_index(1, 1, dimension) == count);
    }

    assert(ndslice::plane_name(0, 3) == "XW");
    assert(ndslice::plane_name(4, 5) == "VU");
    assert(ndslice::axis_name(7) == "A7");
  }

  {
    // Zero angles give the canonical slice
    for (std::size_t dimension = 2; dimension <= ndslice::kMaxDimension; ++dimension) {
      ndslice::MatrixN rotation{};
      assert(ndslice::compose_rotation(dimension, nullptr, 0, rotation) == ndslice::Status::kSuccess);

      ndslice::VectorN origin{};
      assert(ndslice::make_slice_origin(dimension, nullptr, 0, origin) == ndslice::Status::kSuccess);

      ndslice::SliceBasis basis{};
      assert(ndslice::project_slice(rotation, origin, basis) == ndslice::Status::kSuccess);
      for (std::size_t axis = 0; axis < ndslice::kMaxDimension; ++axis) {
        assert(basis.basis_x[axis] == (axis == 0 ? 1.0f : 0.0f));
        assert(basis.basis_y[axis] == (axis == 1 ? 1.0f : 0.0f));
        assert(basis.basis_z[axis] == (axis == 2 && dimension > 2 ? 1.0f : 0.0f));
        assert(basis.origin[axis] == 0.0f);
      }
    }
  }

  {
    // Random angle sets stay orthonormal in every supported dimension
    std::mt19937 rng(1234U);
    std::uniform_real_distribution<float> angle_dist(-10.0f, 10.0f);

    for (std::size_t dimension = 2; dimension <= ndslice::kMaxDimension; ++dimension) {
      std::vector<ndslice::RotationAngle> angles;
      for (std::size_t index = 0; index < ndslice::rotation_plane_count(dimension); ++index) {
        ndslice::RotationAngle angle{};
        ndslice::rotation_plane_at(index, dimension, angle.i, angle.j);
        angle.theta = angle_dist(rng);
        angles.push_back(angle);
      }

      ndslice::MatrixN rotation{};
      assert(ndslice::compose_rotation(dimension, angles.data(), angles.size(), rotation) ==
             ndslice::Status::kSuccess);
      assert(ndslice::orthogonality_drift(rotation) < 1e-4f);

      ndslice::SliceBasis basis{};
      ndslice::VectorN origin{};
      ndslice::project_slice(rotation, origin, basis);
      assert(approx_equal(length(basis.basis_x), 1.0f, 1e-4f));
      assert(approx_equal(length(basis.basis_y), 1.0f, 1e-4f));
      if (dimension > 2) {
        assert(approx_equal(length(basis.basis_z), 1.0f, 1e-4f));
      }
    }
  }

  {
    // Input order does not matter: planes compose in ascending order
    const ndslice::RotationAngle forward[] = {{0U, 1U, 0.3f}, {1U, 3U, 1.1f}, {2U, 4U, -0.7f}};
    const ndslice::RotationAngle shuffled[] = {{2U, 4U, -0.7f}, {0U, 1U, 0.3f}, {1U, 3U, 1.1f}};

    ndslice::MatrixN a{};
    ndslice::MatrixN b{};
    assert(ndslice::compose_rotation(5, forward, 3, a) == ndslice::Status::kSuccess);
    assert(ndslice::compose_rotation(5, shuffled, 3, b) == ndslice::Status::kSuccess);
    for (std::size_t k = 0; k < a.data.size(); ++k) {
      assert(a.data[k] == b.data[k]);
    }

    // Explicit product check for two planes: R = G(0,1) * G(1,2)
    const ndslice::RotationAngle pair[] = {{1U, 2U, kHalfPi}, {0U, 1U, kHalfPi}};
    ndslice::MatrixN product{};
    ndslice::compose_rotation(3, pair, 2, product);
    // G(0,1) maps e1 -> -e0; G(1,2) maps e2 -> -e1; so R e2 = G(0,1)(-e1) = e0
    assert(approx_equal(product.at(0, 2), 1.0f));
    assert(approx_equal(product.at(1, 2), 0.0f));
    assert(approx_equal(product.at(2, 2), 0.0f));
  }

  {
    // XW rotation by 45 degrees tilts basisX into W
    const ndslice::RotationAngle xw[] = {{0U, 3U, kQuarterPi}};
    ndslice::MatrixN rotation{};
    assert(ndslice::compose_rotation(4, xw, 1, rotation) == ndslice::Status::kSuccess);

    ndslice::VectorN origin{};
    ndslice::SliceBasis basis{};
    ndslice::project_slice(rotation, origin, basis);

    const float c = std::cos(kQuarterPi);
    const float s = std::sin(kQuarterPi);
    assert(approx_equal(basis.basis_x[0], c));
    assert(approx_equal(basis.basis_x[1], 0.0f));
    assert(approx_equal(basis.basis_x[2], 0.0f));
    assert(approx_equal(basis.basis_x[3], s));
    assert(approx_equal(basis.basis_y[1], 1.0f));
    assert(approx_equal(basis.basis_z[2], 1.0f));
  }

  {
    // Malformed angle sets are rejected and leave the identity
    const ndslice::RotationAngle duplicate[] = {{0U, 1U, 0.5f}, {0U, 1U, 0.25f}};
    const ndslice::RotationAngle reversed[] = {{2U, 1U, 0.5f}};
    const ndslice::RotationAngle out_of_range[] = {{0U, 4U, 0.5f}};

    ndslice::MatrixN rotation{};
    assert(ndslice::compose_rotation(3, duplicate, 2, rotation) == ndslice::Status::kDuplicatePlane);
    assert(ndslice::compose_rotation(3, reversed, 1, rotation) == ndslice::Status::kInvalidPlane);
    assert(ndslice::compose_rotation(4, out_of_range, 1, rotation) == ndslice::Status::kInvalidPlane);
    assert(rotation.order == 4);
    assert(rotation.at(0, 0) == 1.0f && rotation.at(0, 3) == 0.0f);

    assert(ndslice::compose_rotation(1, nullptr, 0, rotation) == ndslice::Status::kInvalidDimension);
    assert(ndslice::compose_rotation(12, nullptr, 0, rotation) == ndslice::Status::kInvalidDimension);
  }

  {
    // Non-finite angles are treated as zero; large angles wrap
    const ndslice::RotationAngle nan_angle[] = {{0U, 1U, std::numeric_limits<float>::quiet_NaN()}};
    ndslice::MatrixN rotation{};
    assert(ndslice::compose_rotation(3, nan_angle, 1, rotation) == ndslice::Status::kSuccess);
    assert(rotation.at(0, 0) == 1.0f && rotation.at(1, 1) == 1.0f && rotation.at(0, 1) == 0.0f);

    assert(ndslice::sanitize_angle(std::numeric_limits<float>::infinity()) == 0.0f);
    const float wrapped = ndslice::sanitize_angle(-kHalfPi);
    assert(wrapped >= 0.0f && approx_equal(wrapped, 3.0f * kHalfPi, 1e-4f));
  }

  {
    // Slice parameters offset the origin along the hidden axes
    const float parameters[] = {0.5f, -0.25f};
    ndslice::VectorN origin{};
    assert(ndslice::make_slice_origin(5, parameters, 2, origin) == ndslice::Status::kSuccess);
    assert(origin[0] == 0.0f && origin[2] == 0.0f);
    assert(origin[3] == 0.5f && origin[4] == -0.25f);

    // Surplus parameters are ignored
    assert(ndslice::make_slice_origin(4, parameters, 2, origin) == ndslice::Status::kSuccess);
    assert(origin[3] == 0.5f && origin[4] == 0.0f);
  }

  {
    // Vertex projection inverts the slice mapping for points in the slice
    const ndslice::RotationAngle angles[] = {{0U, 3U, 0.4f}, {1U, 2U, 1.2f}, {2U, 4U, -0.9f}};
    ndslice::MatrixN rotation{};
    ndslice::compose_rotation(5, angles, 3, rotation);

    const float parameters[] = {0.3f, 0.1f};
    ndslice::VectorN origin{};
    ndslice::make_slice_origin(5, parameters, 2, origin);

    ndslice::SliceBasis basis{};
    ndslice::project_slice(rotation, origin, basis);

    const std::size_t vertex_count = 2;
    const float local[vertex_count][3] = {{0.5f, -1.0f, 2.0f}, {-0.25f, 0.75f, 0.0f}};
    float vertices[5 * vertex_count] = {0.0f};
    for (std::size_t v = 0; v < vertex_count; ++v) {
      float point[ndslice::kMaxDimension] = {0.0f};
      ndslice::map_to_nd(basis, local[v][0], local[v][1], local[v][2], point);
      for (std::size_t axis = 0; axis < 5; ++axis) {
        vertices[axis * vertex_count + v] = point[axis];
      }
    }

    float positions[3 * vertex_count] = {0.0f};
    assert(ndslice::project_vertices(basis, ndslice::ConstBufferView{vertices, 5 * vertex_count}, vertex_count,
                                     ndslice::BufferView{positions, 3 * vertex_count}) == ndslice::Status::kSuccess);
    for (std::size_t v = 0; v < vertex_count; ++v) {
      for (std::size_t k = 0; k < 3; ++k) {
        assert(approx_equal(positions[v * 3 + k], local[v][k], 1e-4f));
      }
    }

    float small[2] = {0.0f};
    assert(ndslice::project_vertices(basis, ndslice::ConstBufferView{vertices, 5 * vertex_count}, vertex_count,
                                     ndslice::BufferView{small, 2}) == ndslice::Status::kBufferTooSmall);
  }

  {
    // Uniform packing: four zero-padded float[11] blocks
    ndslice::MatrixN rotation{};
    ndslice::compose_rotation(4, nullptr, 0, rotation);
    const float parameters[] = {0.75f};
    ndslice::VectorN origin{};
    ndslice::make_slice_origin(4, parameters, 1, origin);
    ndslice::SliceBasis basis{};
    ndslice::project_slice(rotation, origin, basis);

    float packed[ndslice::kSliceUniformFloats];
    for (float& value : packed) {
      value = -1.0f;
    }
    assert(ndslice::pack_slice_uniforms(basis, ndslice::BufferView{packed, ndslice::kSliceUniformFloats}) ==
           ndslice::Status::kSuccess);
    assert(packed[0] == 1.0f);
    assert(packed[11 + 1] == 1.0f);
    assert(packed[22 + 2] == 1.0f);
    assert(packed[33 + 3] == 0.75f);
    for (std::size_t axis = 4; axis < ndslice::kMaxDimension; ++axis) {
      assert(packed[axis] == 0.0f && packed[33 + axis] == 0.0f);
    }

    float short_buffer[10];
    assert(ndslice::pack_slice_uniforms(basis, ndslice::BufferView{short_buffer, 10}) ==
           ndslice::Status::kBufferTooSmall);
  }

  {
    // Sphere fold inside the inner radius scales by fixed^2 / min^2
    float z[3] = {0.1f, 0.2f, 0.0f};
    const float factor = ndslice::sphere_fold(z, 3, 0.25f, 1.0f);
    assert(approx_equal(factor, 4.0f));
    assert(approx_equal(z[0], 0.4f));
    assert(approx_equal(z[1], 0.8f));
    assert(approx_equal(z[2], 0.0f));

    // Outside the fixed radius nothing changes
    float far[3] = {2.0f, 0.0f, 0.0f};
    assert(ndslice::sphere_fold(far, 3, 0.25f, 1.0f) == 1.0f);
    assert(far[0] == 2.0f);

    float box[3] = {1.5f, -0.5f, -3.0f};
    ndslice::box_fold(box, 3, 1.0f);
    assert(approx_equal(box[0], 0.5f));
    assert(approx_equal(box[1], -0.5f));
    assert(approx_equal(box[2], 1.0f));
  }

  {
    // Power-2 map doubles the polar angle: +Y goes to -X
    float z[3] = {0.0f, 1.0f, 0.0f};
    float out[3] = {0.0f};
    ndslice::hyperbulb_power_map(z, 3, 2.0f, out);
    assert(approx_equal(out[0], -1.0f, 1e-4f));
    assert(approx_equal(out[1], 0.0f, 1e-4f));
    assert(approx_equal(out[2], 0.0f, 1e-4f));

    // Radius goes to r^power in higher dimensions too
    float z6[6] = {0.3f, -0.2f, 0.5f, 0.1f, 0.4f, -0.6f};
    float out6[6] = {0.0f};
    ndslice::hyperbulb_power_map(z6, 6, 3.0f, out6);
    float r2_in = 0.0f;
    float r2_out = 0.0f;
    for (std::size_t axis = 0; axis < 6; ++axis) {
      r2_in += z6[axis] * z6[axis];
      r2_out += out6[axis] * out6[axis];
    }
    assert(approx_equal(std::sqrt(r2_out), std::pow(std::sqrt(r2_in), 3.0f), 1e-4f));
  }

  {
    // Family defaults validate and field families march with a safety factor
    for (std::size_t family = 0; family < ndslice::kEstimatorFamilyCount; ++family) {
      for (std::size_t dimension = 2; dimension <= ndslice::kMaxDimension; ++dimension) {
        const ndslice::EstimatorConfig config =
            ndslice::default_estimator_config(static_cast<ndslice::EstimatorFamily>(family), dimension);
        assert(ndslice::validate_estimator_config(config) == ndslice::Status::kSuccess);
      }
    }

    ndslice::EstimatorConfig kali = ndslice::default_estimator_config(ndslice::EstimatorFamily::kKali, 4);
    auto estimator = ndslice::make_estimator(kali);
    assert(estimator != nullptr);
    assert(estimator->kind() == ndslice::EstimatorKind::kField);
    assert(estimator->safety_factor() < 1.0f);
    assert(approx_equal(ndslice::effective_step(*estimator, 2.0f), 2.0f * kali.safety_factor));

    kali.safety_factor = 1.0f;
    ndslice::Status status = ndslice::Status::kSuccess;
    assert(ndslice::make_estimator(kali, &status) == nullptr);
    assert(status == ndslice::Status::kInvalidConfig);

    ndslice::EstimatorConfig bulb = ndslice::default_estimator_config(ndslice::EstimatorFamily::kHyperbulb, 3);
    bulb.max_iterations = 0;
    assert(ndslice::validate_estimator_config(bulb) == ndslice::Status::kInvalidConfig);

    ndslice::EstimatorFamily parsed{};
    assert(ndslice::parse_family("mandelbox", parsed) && parsed == ndslice::EstimatorFamily::kMandelbox);
    assert(!ndslice::parse_family("julia", parsed));
  }

  {
    // Kali stays finite for points at the origin
    const ndslice::EstimatorConfig config = ndslice::default_estimator_config(ndslice::EstimatorFamily::kKali, 5);
    auto estimator = ndslice::make_estimator(config);
    const float point[5] = {0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
    const ndslice::EstimatorResult result = estimator->evaluate(point, 0);
    assert(std::isfinite(result.distance));
    assert(std::isfinite(result.trap));
    assert(result.iterations <= config.max_iterations);
  }

  {
    // Degenerate inputs never produce NaN
    for (std::size_t family = 0; family < ndslice::kEstimatorFamilyCount; ++family) {
      const ndslice::EstimatorConfig config =
          ndslice::default_estimator_config(static_cast<ndslice::EstimatorFamily>(family), 2);
      auto estimator = ndslice::make_estimator(config);
      const float zero[2] = {0.0f, 0.0f};
      const float far[2] = {1e6f, -1e6f};
      assert(!std::isnan(estimator->evaluate(zero, 0).distance));
      assert(!std::isnan(estimator->evaluate(far, 0).distance));
    }
  }

  {
    // Iteration budget caps work
    const ndslice::EstimatorConfig config = ndslice::default_estimator_config(ndslice::EstimatorFamily::kHyperbulb, 4);
    auto estimator = ndslice::make_estimator(config);
    const float inside[4] = {0.0f, 0.0f, 0.0f, 0.0f};
    assert(estimator->evaluate(inside, 5).iterations == 5);
    assert(estimator->evaluate(inside, 0).iterations == config.max_iterations);
    assert(estimator->evaluate(inside, 10000).iterations == config.max_iterations);
  }

  {
    // Sphere through a 4D slice at w = 0.6 has cross-section radius 0.8
    ndslice::SliceEngine engine(4, ndslice::EstimatorFamily::kSphere);
    assert(engine.set_slice_parameter(0, 0.6f) == ndslice::Status::kSuccess);

    ndslice::FrameUniforms frame{};
    assert(engine.update(frame) == ndslice::Status::kSuccess);
    auto estimator = engine.make_estimator();
    assert(estimator != nullptr);

    ndslice::RaymarchSettings settings{};
    const ndslice::RayHit hit = ndslice::raymarch(*estimator, frame.basis, {0.0f, 0.0f, -5.0f}, {0.0f, 0.0f, 2.0f},
                                                  settings);
    assert(hit.outcome == ndslice::MarchOutcome::kHit);
    assert(hit.sample.distance < ndslice::surface_threshold(settings, hit.t));
    assert(approx_equal(hit.t, 5.0f - 0.8f, 5e-3f));
    assert(approx_equal(hit.normal[2], -1.0f, 1e-2f));

    const ndslice::RayHit miss = ndslice::raymarch(*estimator, frame.basis, {0.0f, 3.0f, -5.0f}, {0.0f, 0.0f, 1.0f},
                                                   settings);
    assert(miss.outcome == ndslice::MarchOutcome::kMiss);
  }

  {
    // Step budget runs out before the sphere is reached
    ndslice::SliceEngine engine(3, ndslice::EstimatorFamily::kSphere);
    ndslice::FrameUniforms frame{};
    assert(engine.update(frame) == ndslice::Status::kSuccess);
    auto estimator = engine.make_estimator();

    ndslice::RaymarchSettings settings{};
    settings.max_steps = 1;
    const ndslice::RayHit hit = ndslice::raymarch(*estimator, frame.basis, {0.0f, 0.0f, -10.0f}, {0.0f, 0.0f, 1.0f},
                                                  settings);
    assert(hit.outcome == ndslice::MarchOutcome::kStepExhausted);
    assert(hit.steps == 1);
  }

  {
    // Surface threshold grows linearly with t
    ndslice::RaymarchSettings settings{};
    settings.surface_epsilon = 1e-3f;
    settings.threshold_growth = 0.5f;
    assert(approx_equal(ndslice::surface_threshold(settings, 0.0f), 1e-3f, 1e-7f));
    assert(approx_equal(ndslice::surface_threshold(settings, 4.0f), 3e-3f, 1e-7f));
    assert(ndslice::surface_threshold(settings, 8.0f) > ndslice::surface_threshold(settings, 4.0f));
  }

  {
    // Escaping orbits keep a fractional iteration count
    const ndslice::EstimatorConfig config = ndslice::default_estimator_config(ndslice::EstimatorFamily::kHyperbulb, 3);
    auto estimator = ndslice::make_estimator(config);
    const float point[3] = {1.2f, 0.3f, 0.1f};
    const ndslice::EstimatorResult result = estimator->evaluate(point, 0);
    assert(result.escaped);
    assert(result.smooth_iterations > static_cast<float>(result.iterations));
    assert(result.smooth_iterations < static_cast<float>(result.iterations + 1));

    assert(approx_equal(ndslice::smooth_escape(3, 4.0f, 4.0f, 2.0f), 4.0f, 1e-5f));
    assert(approx_equal(ndslice::smooth_escape(3, 16.0f, 4.0f, 2.0f), 3.0f, 1e-5f));
    assert(ndslice::smooth_escape(3, 0.5f, 4.0f, 2.0f) == 3.0f);
  }

  {
    // Hyperbulb rays toward the origin stop on the bulb, which lies inside radius 1.11
    ndslice::SliceEngine engine(3, ndslice::EstimatorFamily::kHyperbulb);
    ndslice::FrameUniforms frame{};
    assert(engine.update(frame) == ndslice::Status::kSuccess);
    auto estimator = engine.make_estimator();

    ndslice::RaymarchSettings settings{};
    settings.max_steps = 1000;
    settings.threshold_growth = 0.25f;
    const ndslice::RayHit hit = ndslice::raymarch(*estimator, frame.basis, {0.0f, 0.0f, -3.0f}, {0.0f, 0.0f, 1.0f},
                                                  settings);
    assert(hit.outcome == ndslice::MarchOutcome::kHit);
    assert(hit.t > 1.8f && hit.t < 3.0f);
    assert(hit.sample.distance < ndslice::surface_threshold(settings, hit.t));
    assert(ndslice::surface_threshold(settings, hit.t) > settings.surface_epsilon);
  }

  {
    // Mandelbox rays stop before entering the set: every sample ahead of the hit escapes
    ndslice::SliceEngine engine(3, ndslice::EstimatorFamily::kMandelbox);
    ndslice::FrameUniforms frame{};
    assert(engine.update(frame) == ndslice::Status::kSuccess);
    auto estimator = engine.make_estimator();

    ndslice::RaymarchSettings settings{};
    settings.max_steps = 4000;
    settings.max_distance = 60.0f;

    const std::array<std::array<float, 3>, 3> origins = {{{20.0f, 0.0f, 0.0f},
                                                          {12.0f, 12.0f, 12.0f},
                                                          {-16.0f, 8.0f, 4.0f}}};
    for (const auto& origin : origins) {
      const std::array<float, 3> direction{-origin[0], -origin[1], -origin[2]};
      const ndslice::RayHit hit = ndslice::raymarch(*estimator, frame.basis, origin, direction, settings);
      assert(hit.outcome == ndslice::MarchOutcome::kHit);

      const float length = std::sqrt(origin[0] * origin[0] + origin[1] * origin[1] + origin[2] * origin[2]);
      assert(hit.t > 0.0f && hit.t < length);
      for (int k = 0; k < 64; ++k) {
        const float t = hit.t * static_cast<float>(k) / 64.0f;
        const std::array<float, 3> p{origin[0] * (1.0f - t / length), origin[1] * (1.0f - t / length),
                                     origin[2] * (1.0f - t / length)};
        assert(ndslice::sample_slice(*estimator, frame.basis, p, 0).escaped);
      }
    }
  }

  {
    // Julia mode iterates against a fixed constant instead of the sample point
    ndslice::EstimatorConfig config = ndslice::default_estimator_config(ndslice::EstimatorFamily::kMandelbox, 3);
    const float point[3] = {3.0f, 0.0f, 0.0f};

    auto mandel = ndslice::make_estimator(config);
    assert(mandel->evaluate(point, 0).escaped);

    // With c = 0 the orbit of (3,0,0) cycles 1.5, -3, -1.5, 3
    config.mandelbox.julia_mode = true;
    config.mandelbox.julia_constant.fill(0.0f);
    auto julia = ndslice::make_estimator(config);
    const ndslice::EstimatorResult result = julia->evaluate(point, 0);
    assert(!result.escaped);
    assert(result.iterations == config.max_iterations);
    assert(approx_equal(result.trap, 2.25f));
  }

  {
    // Kali field is bounded away from the structure, so outside rays do not stop at once
    const ndslice::EstimatorConfig config = ndslice::default_estimator_config(ndslice::EstimatorFamily::kKali, 3);
    auto estimator = ndslice::make_estimator(config);
    const float outside[3] = {5.0f, 0.0f, 0.0f};
    const float corner[3] = {10.0f, 10.0f, 10.0f};
    assert(estimator->evaluate(outside, 0).distance >= 5.0f - config.kali.bound_radius - 1e-4f);
    assert(estimator->evaluate(corner, 0).distance > 10.0f);

    ndslice::SliceEngine engine(3, ndslice::EstimatorFamily::kKali);
    ndslice::FrameUniforms frame{};
    assert(engine.update(frame) == ndslice::Status::kSuccess);
    auto marched = engine.make_estimator();

    ndslice::RaymarchSettings settings{};
    const ndslice::RayHit inward = ndslice::raymarch(*marched, frame.basis, {0.0f, 0.0f, -5.0f}, {0.0f, 0.0f, 1.0f},
                                                     settings);
    assert(inward.steps > 1);
    assert(inward.outcome != ndslice::MarchOutcome::kHit || inward.t > 5.0f - config.kali.bound_radius - 0.01f);

    const ndslice::RayHit outward = ndslice::raymarch(*marched, frame.basis, {0.0f, 0.0f, -5.0f}, {0.0f, 0.0f, -1.0f},
                                                      settings);
    assert(outward.outcome == ndslice::MarchOutcome::kMiss);
  }

  {
    // Dimension change drops planes that no longer exist
    ndslice::SliceEngine engine(5, ndslice::EstimatorFamily::kMandelbox);
    assert(engine.set_angle(0U, 4U, 0.3f) == ndslice::Status::kSuccess);
    assert(engine.set_angle(0U, 1U, 0.2f) == ndslice::Status::kSuccess);
    assert(engine.set_angle(0U, 1U, 0.4f) == ndslice::Status::kSuccess);
    assert(engine.angles().size() == 2);
    assert(engine.angles()[0].j == 1U && approx_equal(engine.angles()[0].theta, 0.4f));
    assert(engine.slice_parameters().size() == 2);

    assert(engine.set_dimension(4) == ndslice::Status::kSuccess);
    assert(engine.angles().size() == 1);
    assert(engine.slice_parameters().size() == 1);
    assert(engine.estimator_config().dimension == 4);
    assert(engine.estimator_config().family == ndslice::EstimatorFamily::kMandelbox);

    assert(engine.set_dimension(12) == ndslice::Status::kInvalidDimension);
    assert(engine.set_angle(0U, 4U, 0.1f) == ndslice::Status::kInvalidPlane);
    assert(engine.dimension() == 4);

    ndslice::EstimatorConfig wrong = ndslice::default_estimator_config(ndslice::EstimatorFamily::kKali, 3);
    assert(engine.set_estimator_config(wrong) == ndslice::Status::kInvalidDimension);
  }

  {
    // Snapshots round-trip and reject unknown versions
    ndslice::SliceEngine engine(6, ndslice::EstimatorFamily::kHyperbulb);
    engine.set_angle(1U, 5U, 1.0f);
    engine.set_slice_parameter(2, 0.125f);
    engine.estimator_config().hyperbulb.power = 6.0f;

    const ndslice::SceneSnapshot snapshot = engine.snapshot();
    assert(snapshot.version == ndslice::kSnapshotVersion);

    ndslice::SliceEngine restored(3, ndslice::EstimatorFamily::kSphere);
    assert(restored.restore(snapshot) == ndslice::Status::kSuccess);
    assert(restored.dimension() == 6);
    assert(restored.angles().size() == 1);
    assert(restored.slice_parameters()[2] == 0.125f);
    assert(restored.estimator_config().hyperbulb.power == 6.0f);

    ndslice::SceneSnapshot corrupt = snapshot;
    corrupt.angles[0].theta = std::numeric_limits<float>::quiet_NaN();
    ndslice::SliceEngine sanitized(3, ndslice::EstimatorFamily::kSphere);
    assert(sanitized.restore(corrupt) == ndslice::Status::kSuccess);
    assert(sanitized.angles()[0].theta == 0.0f);
    assert(std::isfinite(sanitized.snapshot().angles[0].theta));

    ndslice::SceneSnapshot future = snapshot;
    future.version = ndslice::kSnapshotVersion + 1;
    ndslice::SliceEngine untouched(3, ndslice::EstimatorFamily::kSphere);
    assert(untouched.restore(future) == ndslice::Status::kVersionMismatch);
    assert(untouched.dimension() == 3);
  }

  {
    // C ABI
    assert(ndslice_rotation_plane_count(4) == 6);

    const NdsliceRotationAngle angles[] = {{0U, 3U, kQuarterPi}};
    float matrix[16] = {0.0f};
    assert(ndslice_compose_rotation(4, angles, 1, matrix, 16) == NDSLICE_OK);
    assert(ndslice_orthogonality_drift(matrix, 4) < 1e-5f);
    assert(ndslice_compose_rotation(4, angles, 1, matrix, 8) == NDSLICE_ERROR_BUFFER_TOO_SMALL);

    const float parameters[] = {0.2f};
    float uniforms[NDSLICE_SLICE_UNIFORM_FLOATS] = {0.0f};
    assert(ndslice_compute_slice_uniforms(4, angles, 1, parameters, 1, uniforms, NDSLICE_SLICE_UNIFORM_FLOATS) ==
           NDSLICE_OK);
    assert(approx_equal(uniforms[3], std::sin(kQuarterPi)));

    // One vertex placed at the slice origin, which is R [0, 0, 0, 0.2]
    float vertices[4] = {0.0f};
    float positions[3] = {1.0f, 1.0f, 1.0f};
    for (std::size_t axis = 0; axis < 4; ++axis) {
      vertices[axis] = uniforms[33 + axis];
    }
    assert(ndslice_project_vertices(uniforms, 4, vertices, 1, positions, 3) == NDSLICE_OK);
    assert(approx_equal(positions[0], 0.0f) && approx_equal(positions[1], 0.0f) && approx_equal(positions[2], 0.0f));

    const NdsliceRotationAngle duplicate[] = {{0U, 1U, 0.1f}, {0U, 1U, 0.2f}};
    assert(ndslice_compute_slice_uniforms(4, duplicate, 2, nullptr, 0, uniforms, NDSLICE_SLICE_UNIFORM_FLOATS) ==
           NDSLICE_ERROR_DUPLICATE_PLANE);
    assert(std::string(ndslice_status_string(NDSLICE_ERROR_DUPLICATE_PLANE)) == "Duplicate rotation plane");
  }

  return 0;
}
