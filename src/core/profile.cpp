/**
 * @file profile.cpp
 * @brief Implementation of the section profiler described in profile.hpp
 */

#include "ballsim/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    instance.open.push_back(OpenSection{name, Clock::now(), Duration{0}});
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") with no open section.\n";
        return;
    }
    if (instance.open.back().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but innermost section is \"" << instance.open.back().name << "\".\n";
        return;
    }

    OpenSection const finished = instance.open.back();
    instance.open.pop_back();

    Duration const duration = Clock::now() - finished.start;

    auto& stats = instance.sections[name];
    stats.total_time += duration;
    stats.self_time  += duration - finished.children;
    stats.call_count += 1;
    stats.min_time = std::min(stats.min_time, duration);
    stats.max_time = std::max(stats.max_time, duration);

    if (!instance.open.empty()) {
        instance.open.back().children += duration;
    }
}

void Profiler::printStats() {
    auto& instance = getInstance();

    std::vector<std::pair<std::string, SectionStats>> rows(instance.sections.begin(),
                                                           instance.sections.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& [name, stats] : rows) {
        double const totalMs = std::chrono::duration<double, std::milli>(stats.total_time).count();
        double const selfMs  = std::chrono::duration<double, std::milli>(stats.self_time).count();
        double const avgUs   = stats.call_count > 0
            ? std::chrono::duration<double, std::micro>(stats.total_time).count() / stats.call_count
            : 0.0;

        std::cout << "  " << std::left << std::setw(28) << name << std::right
                  << " [" << stats.call_count << " calls] "
                  << std::fixed << std::setprecision(2)
                  << totalMs << "ms total, "
                  << selfMs << "ms self, "
                  << avgUs << "us avg\n";
    }
}

void Profiler::reset() {
    getInstance().sections.clear();
}

Profiler::SectionStats Profiler::getStats(const std::string& name) {
    auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return SectionStats{};
    }
    return it->second;
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
