#ifndef NDSHADER_MODULE_H
#define NDSHADER_MODULE_H

#include <cstddef>
#include <string>
#include <vector>

namespace ndshader {

enum class UniformType {
    kFloat = 0,
    kInt,
    kVec3
};

// One entry of a variant's uniform layout. arity 1 is a scalar, anything
// larger is a fixed-size array.
struct UniformDecl {
    std::string name;
    UniformType type;
    size_t arity;
};

bool operator==(const UniformDecl& a, const UniformDecl& b);

const char* glsl_type_name(UniformType type);

// "uniform float uBasisX[11];"
std::string declare_uniform(const UniformDecl& decl);

// Fixed emission order. Modules of one variant must appear with
// non-decreasing stage.
enum class ModuleStage {
    kHeader = 0,
    kSharedUniforms,
    kFamilyUniforms,
    kMath,
    kEstimator,
    kRaymarch,
    kNormals,
    kLighting,
    kShadows,
    kAmbientOcclusion,
    kColor,
    kOpacity,
    kMain
};

const char* stage_name(ModuleStage stage);

// A source block plus its interface. `consumes` names capabilities that an
// earlier module must have listed in `produces`; the composer checks this
// before emitting anything.
struct ShaderModule {
    std::string name;
    ModuleStage stage;
    std::vector<UniformDecl> uniforms;
    std::vector<std::string> consumes;
    std::vector<std::string> produces;
    std::string source;
};

} // namespace ndshader

#endif // NDSHADER_MODULE_H
