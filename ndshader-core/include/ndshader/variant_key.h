#ifndef NDSHADER_VARIANT_KEY_H
#define NDSHADER_VARIANT_KEY_H

#include "ndslice/estimators.hpp"
#include <cstddef>
#include <string>

namespace ndshader {

using ndslice::EstimatorFamily;

enum class OpacityMode {
    kSolid = 0,
    kSimpleAlpha,
    kLayeredSurfaces,
    kVolumetricDensity
};

enum class ColorAlgorithm {
    kMonochromatic = 0,
    kCosine,
    kNormal,
    kDistance,
    kOrbitTrap
};

constexpr std::size_t kOpacityModeCount = 4;
constexpr std::size_t kColorAlgorithmCount = 5;

// Bumped whenever the composed bytes for an existing key would change
constexpr int kVariantKeyVersion = 1;

struct FeatureFlags {
    bool normals = true;
    bool lighting = true;
    bool shadows = false;
    bool ambient_occlusion = false;
    bool fresnel = false;
    OpacityMode opacity = OpacityMode::kSolid;
    ColorAlgorithm color = ColorAlgorithm::kCosine;
};

struct VariantKey {
    EstimatorFamily family = EstimatorFamily::kHyperbulb;
    size_t dimension = 3;
    FeatureFlags features;

    // Stable, versioned text form used as cache key and in share URLs:
    // v1|hyperbulb|d3|n1|l1|s0|ao0|f0|solid|cosine
    std::string canonical() const;
};

bool operator==(const VariantKey& a, const VariantKey& b);
bool operator!=(const VariantKey& a, const VariantKey& b);

// Strict inverse of VariantKey::canonical(). Rejects other versions.
bool parse_variant_key(const std::string& text, VariantKey& out);

const char* opacity_mode_name(OpacityMode mode);
bool parse_opacity_mode(const std::string& name, OpacityMode& out);

const char* color_algorithm_name(ColorAlgorithm algorithm);
bool parse_color_algorithm(const std::string& name, ColorAlgorithm& out);

} // namespace ndshader

#endif // NDSHADER_VARIANT_KEY_H
