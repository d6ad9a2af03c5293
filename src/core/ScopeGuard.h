#pragma once

#include <utility>

// ============================================================================
// ScopeGuard - runs a cleanup callable when the scope exits
// ============================================================================
// Used around C APIs that hand out raw allocations (stb_image pixels,
// miniz heap buffers and reader/writer state).
//
//   mz_zip_archive zip{};
//   if (!mz_zip_reader_init_mem(&zip, data, size, 0)) return ...;
//   auto zipGuard = makeScopeGuard([&]() { mz_zip_reader_end(&zip); });

namespace LabPBR {

template<typename F>
class ScopeGuard {
public:
    explicit ScopeGuard(F func) : cleanup_(std::move(func)) {}

    ~ScopeGuard() {
        if (active_) {
            cleanup_();
        }
    }

    // Skip the cleanup, e.g. after ownership moved elsewhere
    void dismiss() { active_ = false; }

    ScopeGuard(ScopeGuard&& other) noexcept
        : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
        other.active_ = false;
    }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ScopeGuard& operator=(ScopeGuard&&) = delete;

private:
    F cleanup_;
    bool active_ = true;
};

template<typename F>
ScopeGuard<F> makeScopeGuard(F func) {
    return ScopeGuard<F>(std::move(func));
}

} // namespace LabPBR
