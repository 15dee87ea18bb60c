#include "ndshader/variant_cache.h"
#include <spdlog/spdlog.h>

namespace ndshader {

const char* variant_state_name(VariantState state) {
    switch (state) {
        case VariantState::kUncached: return "uncached";
        case VariantState::kComposing: return "composing";
        case VariantState::kCached: return "cached";
        case VariantState::kFailed: return "failed";
    }
    return "unknown";
}

VariantCache::VariantCache(const ComposerOptions& options) : options_(options) {}

VariantPtr VariantCache::find(const VariantKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key.canonical());
    if (it == entries_.end() || it->second.state != VariantState::kCached) {
        return nullptr;
    }
    return it->second.variant;
}

VariantPtr VariantCache::get_or_compose(const VariantKey& key, std::string* error, CompositionErrorKind* kind) {
    const std::string canonical = key.canonical();
    ComposerOptions options;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& entry = entries_[canonical];
        if (entry.state == VariantState::kCached) {
            return entry.variant;
        }
        if (entry.state == VariantState::kFailed) {
            if (error) *error = entry.error;
            if (kind) *kind = entry.error_kind;
            return nullptr;
        }
        entry.state = VariantState::kComposing;
        options = options_;
    }

    Composer composer(options);
    std::unique_ptr<CompiledVariant> composed = composer.compose(key);

    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = entries_[canonical];
    if (entry.state == VariantState::kCached) {
        return entry.variant;
    }
    if (!composed) {
        entry.state = VariantState::kFailed;
        entry.variant.reset();
        entry.error = composer.get_error();
        entry.error_kind = composer.get_error_kind();
        if (error) *error = entry.error;
        if (kind) *kind = entry.error_kind;
        return nullptr;
    }
    if (!(options == options_)) {
        // Options changed while composing; the result is stale
        entries_.erase(canonical);
        if (error) *error = "Composer options changed during composition";
        if (kind) *kind = CompositionErrorKind::kConflict;
        return nullptr;
    }

    entry.state = VariantState::kCached;
    entry.variant = VariantPtr(std::move(composed));
    entry.error.clear();
    entry.error_kind = CompositionErrorKind::kNone;
    return entry.variant;
}

VariantState VariantCache::state(const VariantKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key.canonical());
    return it == entries_.end() ? VariantState::kUncached : it->second.state;
}

bool VariantCache::mark_linked(const VariantKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key.canonical());
    if (it == entries_.end() || it->second.state != VariantState::kCached) {
        return false;
    }
    last_good_[key.family] = it->second.variant;
    return true;
}

VariantPtr VariantCache::report_compilation_failure(const VariantKey& key, const std::string& log) {
    const std::string canonical = key.canonical();

    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = entries_[canonical];
    entry.state = VariantState::kFailed;
    entry.variant.reset();
    entry.error = "GPU compilation failed: " + log;
    entry.error_kind = CompositionErrorKind::kCompilationFailed;

    VariantPtr fallback;
    auto good = last_good_.find(key.family);
    if (good != last_good_.end()) {
        if (good->second && good->second->key == key) {
            last_good_.erase(good);
        } else {
            fallback = good->second;
        }
    }

    spdlog::error("ndshader: GPU rejected variant {}: {}", canonical, log);
    if (fallback) {
        spdlog::error("ndshader: falling back to {}", fallback->key.canonical());
    } else {
        spdlog::error("ndshader: no known good {} variant to fall back to", ndslice::family_name(key.family));
    }
    return fallback;
}

VariantPtr VariantCache::last_good(EstimatorFamily family) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_good_.find(family);
    return it == last_good_.end() ? nullptr : it->second;
}

size_t VariantCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    return clear_locked();
}

size_t VariantCache::clear_locked() {
    const size_t removed = entries_.size();
    entries_.clear();
    last_good_.clear();
    spdlog::info("ndshader: cleared variant cache ({} entries)", removed);
    return removed;
}

size_t VariantCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cached = 0;
    for (const auto& item : entries_) {
        if (item.second.state == VariantState::kCached) {
            ++cached;
        }
    }
    return cached;
}

ComposerOptions VariantCache::options() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

void VariantCache::set_options(const ComposerOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (options == options_) {
        return;
    }
    options_ = options;
    clear_locked();
}

} // namespace ndshader
