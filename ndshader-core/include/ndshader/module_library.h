#ifndef NDSHADER_MODULE_LIBRARY_H
#define NDSHADER_MODULE_LIBRARY_H

#include "module.h"
#include "variant_key.h"
#include <vector>

namespace ndshader {

// uBasisX, uBasisY, uBasisZ, uOrigin (float[11] each, the layout written by
// ndslice::pack_slice_uniforms) followed by the raymarch and camera uniforms.
std::vector<UniformDecl> shared_uniforms();

std::vector<UniformDecl> family_uniforms(EstimatorFamily family);

// Modules for a key in emission order. Selection only; the composer checks
// the feature combination and the module interfaces.
std::vector<ShaderModule> select_modules(const VariantKey& key);

} // namespace ndshader

#endif // NDSHADER_MODULE_LIBRARY_H
