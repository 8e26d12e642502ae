#ifndef PROFILER_HPP
#define PROFILER_HPP

// ============================================================================
// Profiling Configuration
// ============================================================================
// Define ENABLE_PROFILING to time the search phases. Defaults to disabled.
// Enable via: cmake -DENABLE_PROFILING=ON

#ifdef ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

// ============================================================================
// Profiler - per-section call counts and times, reported as a share of the
// time spent inside decisions. Searches run on one thread.
// ============================================================================

class Profiler {
public:
    // Section wrapping a whole decision; the other sections are nested in it
    static constexpr const char* DECISION_SECTION = "MCTS::chooseAction";

    struct SectionStats {
        uint64_t callCount = 0;
        double totalTimeNs = 0.0;
        double maxTimeNs = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const char* section, double durationNs) {
        SectionStats& stats = sections_[section];
        stats.callCount++;
        stats.totalTimeNs += durationNs;
        stats.maxTimeNs = std::max(stats.maxTimeNs, durationNs);
    }

    void reset() { sections_.clear(); }

    void printReport() const {
        std::cout << "\n=== Search Profile ===\n";
        if (sections_.empty()) {
            std::cout << "No sections recorded.\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> rows(sections_.begin(), sections_.end());
        std::sort(rows.begin(), rows.end(),
            [](const auto& a, const auto& b) { return a.second.totalTimeNs > b.second.totalTimeNs; });

        auto decision = sections_.find(DECISION_SECTION);
        double searchNs = decision != sections_.end() ? decision->second.totalTimeNs : 0.0;

        std::cout << std::left << std::setw(30) << "Section"
                  << std::right << std::setw(12) << "Calls"
                  << std::setw(13) << "Total ms"
                  << std::setw(11) << "Avg us"
                  << std::setw(11) << "Max us"
                  << std::setw(10) << "Search %" << "\n";
        std::cout << std::string(87, '-') << "\n";

        for (const auto& [name, stats] : rows) {
            std::cout << std::left << std::setw(30) << name
                      << std::right << std::setw(12) << stats.callCount
                      << std::fixed << std::setprecision(2)
                      << std::setw(13) << stats.totalTimeNs / 1e6
                      << std::setw(11) << stats.totalTimeNs / 1e3 / stats.callCount
                      << std::setw(11) << stats.maxTimeNs / 1e3;
            if (searchNs > 0) {
                std::cout << std::setw(9) << std::setprecision(1) << 100.0 * stats.totalTimeNs / searchNs << "%";
            }
            std::cout << "\n";
        }
        std::cout << "======================\n\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::unordered_map<std::string, SectionStats> sections_;
};

// Records the lifetime of the enclosing scope under `section`
class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section)
        , start_(std::chrono::steady_clock::now()) {
    }

    ~ScopedTimer() {
        std::chrono::duration<double, std::nano> elapsed = std::chrono::steady_clock::now() - start_;
        Profiler::instance().record(section_, elapsed.count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* section_;
    std::chrono::steady_clock::time_point start_;
};

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) ScopedTimer PROFILE_CONCAT(profileTimer_, __LINE__)(name)

#else // ENABLE_PROFILING not defined

// Stub Profiler - No-op when profiling disabled
class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void printReport() const {}
    void reset() {}
};

#define PROFILE_SCOPE(name) ((void)0)

#endif // ENABLE_PROFILING

#endif // PROFILER_HPP
