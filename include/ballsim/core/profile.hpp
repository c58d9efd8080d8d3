/**
 * @file profile.hpp
 * @brief Lightweight timing of named code sections
 *
 * Each PROFILE_SCOPE records how long its enclosing scope took. Samples with
 * the same name are aggregated (call count, total, min, max) until reset().
 * Nested scopes are tracked so a section's self time excludes its children.
 *
 * Example usage:
 * @code
 * void BoundarySystem::update(entt::registry& registry) {
 *     PROFILE_SCOPE("BoundarySystem");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide store of section timings.
 */
class Profiler {
public:
    using Clock    = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    /**
     * @brief Aggregated statistics of one named section
     */
    struct SectionStats {
        Duration total_time{0};
        Duration self_time{0};          ///< total_time minus nested sections
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Opens a section; must be closed by the matching endSection().
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes the innermost open section.
     * @param name Name of the section, checked against the innermost one.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Prints one line per section to stdout, slowest first.
     */
    static void printStats();

    /**
     * @brief Drops all recorded statistics.
     */
    static void reset();

    /**
     * @brief Returns the statistics of a section, or an empty record.
     */
    static SectionStats getStats(const std::string& name);

private:
    struct OpenSection {
        std::string name;
        Clock::time_point start;
        Duration children{0};
    };

    std::map<std::string, SectionStats> sections;
    std::vector<OpenSection> open;

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard that times the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
