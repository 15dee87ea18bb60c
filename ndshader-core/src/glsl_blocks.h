#ifndef NDSHADER_GLSL_BLOCKS_H
#define NDSHADER_GLSL_BLOCKS_H

// GLSL ES 3.00 sources for the module library. DIMENSION, MAX_ITERATIONS and
// the USE_* / OPACITY_MODE / COLOR_ALGORITHM defines are emitted by the
// composer ahead of the header block.

namespace ndshader {
namespace glsl {

extern const char* const kHeader;
extern const char* const kSliceMath;

extern const char* const kSphereEstimator;
extern const char* const kHyperbulbEstimator;
extern const char* const kMandelboxEstimator;
extern const char* const kKaliEstimator;

extern const char* const kRaymarch;
extern const char* const kNormals;
extern const char* const kLighting;
extern const char* const kFresnel;
extern const char* const kShadows;
extern const char* const kAmbientOcclusion;

extern const char* const kColorMonochromatic;
extern const char* const kColorCosine;
extern const char* const kColorNormal;
extern const char* const kColorDistance;
extern const char* const kColorOrbitTrap;

extern const char* const kOpacitySolid;
extern const char* const kOpacitySimpleAlpha;
extern const char* const kOpacityLayeredSurfaces;
extern const char* const kOpacityVolumetricDensity;

extern const char* const kMain;

} // namespace glsl
} // namespace ndshader

#endif // NDSHADER_GLSL_BLOCKS_H
