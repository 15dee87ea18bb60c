#ifndef NDSHADER_VARIANT_CACHE_H
#define NDSHADER_VARIANT_CACHE_H

#include "composer.h"
#include "variant_key.h"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ndshader {

enum class VariantState {
    kUncached = 0,
    kComposing,
    kCached,
    kFailed
};

const char* variant_state_name(VariantState state);

using VariantPtr = std::shared_ptr<const CompiledVariant>;

// Insert-if-absent cache of composed variants keyed by VariantKey::canonical().
// Composition runs outside the lock; two threads racing on one key compose
// the same bytes and the first insert wins. Entries leave only through
// report_compilation_failure() (that key) or clear() (everything).
class VariantCache {
public:
    explicit VariantCache(const ComposerOptions& options = ComposerOptions());

    VariantPtr find(const VariantKey& key) const;

    // Returns the cached variant or composes it. On failure returns nullptr
    // and fills error/kind when given; the key is then kFailed until clear().
    VariantPtr get_or_compose(const VariantKey& key,
                              std::string* error = nullptr,
                              CompositionErrorKind* kind = nullptr);

    VariantState state(const VariantKey& key) const;

    // The host linked this variant successfully: it becomes the fallback for
    // its family. Returns false if the key is not cached.
    bool mark_linked(const VariantKey& key);

    // The host failed to compile or link this variant. Evicts it, marks the
    // key kFailed and returns the last known good variant of the same family
    // (nullptr if there is none).
    VariantPtr report_compilation_failure(const VariantKey& key, const std::string& log);

    VariantPtr last_good(EstimatorFamily family) const;

    // Drops every entry and fallback; returns the number of entries removed
    size_t clear();
    size_t size() const;

    ComposerOptions options() const;
    // Options are part of the composed bytes, so changing them clears the cache
    void set_options(const ComposerOptions& options);

private:
    struct Entry {
        VariantState state = VariantState::kUncached;
        VariantPtr variant;
        std::string error;
        CompositionErrorKind error_kind = CompositionErrorKind::kNone;
    };

    size_t clear_locked();

    mutable std::mutex mutex_;
    ComposerOptions options_;
    std::unordered_map<std::string, Entry> entries_;
    std::map<EstimatorFamily, VariantPtr> last_good_;
};

} // namespace ndshader

#endif // NDSHADER_VARIANT_CACHE_H
