#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace http_notifier {
namespace util {

inline std::string tolower(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'A' && c <= 'Z')
            c += 32;
    return s;
}

inline std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
        sv.remove_suffix(1);
    return sv;
}

/**
 * Look up a header value in raw "Name: value" lines.
 * Name comparison is case-insensitive, the first match wins.
 */
inline std::optional<std::string> findHeader(const std::vector<std::string>& headers, std::string_view name) {
    const std::string wanted = tolower(name);
    for (const auto& line : headers) {
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        if (tolower(trim(std::string_view(line).substr(0, colon))) == wanted)
            return std::string(trim(std::string_view(line).substr(colon + 1)));
    }
    return std::nullopt;
}

// Seconds since epoch
inline double current_time() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * Generate jitter value for backoff delays.
 * Returns a value in range [-max, max] with log-normal distribution.
 */
inline double jitter_generator(double max) {
    max = std::max(0.0, max);
    if (max == 0.0) return 0.0;

    thread_local std::mt19937_64 rg{
        [] {
            std::random_device rd;
            std::seed_seq seq{
                rd(), rd(), rd(), rd(),
                static_cast<unsigned>(
                    std::hash<std::thread::id>{}(std::this_thread::get_id()))
            };
            return std::mt19937_64(seq);
        }()
    };

    // ---- sigma scaling with max ----
    const double ref       = 1e-3;  // 1ms
    const double sigma_min = 0.3;
    const double sigma_max = 1.5;

    double sigma = std::clamp(
        0.4 + 0.3 * std::log1p(max / ref),
        sigma_min,
        sigma_max
    );

    // median ≈ 5% of max
    double mu = std::log(0.05 * max + 1e-12);

    std::lognormal_distribution<double> mag_dist(mu, sigma);
    std::bernoulli_distribution sign_dist(0.5);

    double mag = mag_dist(rg);
    if (mag > max) mag = max;

    return sign_dist(rg) ? mag : -mag;
}

} // namespace util
} // namespace http_notifier
