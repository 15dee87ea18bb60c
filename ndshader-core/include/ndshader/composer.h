#ifndef NDSHADER_COMPOSER_H
#define NDSHADER_COMPOSER_H

#include "module.h"
#include "variant_key.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ndshader {

enum class CompositionErrorKind {
    kNone = 0,
    kInvalidDimension,
    kIncompatibleFeatures,
    kMissingDependency,   // a feature or module input with no producer
    kOrder,               // module stage out of order
    kConflict,            // duplicate module or uniform redeclared with another type
    kCompilationFailed    // rejected by the GPU after composition
};

const char* composition_error_kind_name(CompositionErrorKind kind);

class CompositionError : public std::runtime_error {
public:
    CompositionError(CompositionErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    CompositionErrorKind kind() const { return kind_; }

private:
    CompositionErrorKind kind_;
};

struct ComposerOptions {
    std::string glsl_version = "300 es";
    // Emit a "// module: <name> (<stage>)" line ahead of every module
    bool module_markers = true;
};

bool operator==(const ComposerOptions& a, const ComposerOptions& b);

struct CompiledVariant {
    VariantKey key;
    std::string source;
    std::vector<UniformDecl> uniform_layout;
    std::vector<std::string> modules;

    // Position in uniform_layout, or uniform_layout.size() if absent
    size_t uniform_index(const std::string& name) const;
};

// Throws CompositionError for a dimension outside [2, 11] or a feature set
// whose dependencies are not enabled (lighting needs normals, shadows need
// lighting, fresnel needs lighting, ambient occlusion and the normal color
// algorithm need normals, volumetric density excludes shadows).
void validate_features(const VariantKey& key);

// Throws CompositionError unless stages are non-decreasing, module names are
// unique, every consumed capability was produced by an earlier module and no
// uniform is redeclared with a different type or arity.
void validate_modules(const std::vector<ShaderModule>& modules);

class Composer {
public:
    explicit Composer(const ComposerOptions& options = ComposerOptions());

    // Selects modules for the key and assembles them. Returns nullptr and
    // records the error on failure. Identical keys and options always give
    // byte-identical source.
    std::unique_ptr<CompiledVariant> compose(const VariantKey& key);

    // Assembles an explicit module list for the key
    std::unique_ptr<CompiledVariant> assemble(const VariantKey& key, const std::vector<ShaderModule>& modules);

    const ComposerOptions& options() const { return options_; }

    const std::string& get_error() const { return error_message_; }
    CompositionErrorKind get_error_kind() const { return error_kind_; }

private:
    std::unique_ptr<CompiledVariant> emit(const VariantKey& key, const std::vector<ShaderModule>& modules) const;
    void write_defines(const VariantKey& key, std::string& out) const;

    ComposerOptions options_;
    std::string error_message_;
    CompositionErrorKind error_kind_;
};

} // namespace ndshader

#endif // NDSHADER_COMPOSER_H
