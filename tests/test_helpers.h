#pragma once

#include "Records.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace test_helpers {

inline SearchTermRecord term(const std::string& text,
                             std::optional<double> cost = std::nullopt,
                             std::optional<double> conversions = std::nullopt,
                             std::optional<double> clicks = std::nullopt,
                             std::optional<double> impressions = std::nullopt) {
    SearchTermRecord r;
    r.term = text;
    r.cost = cost;
    r.conversions = conversions;
    r.clicks = clicks;
    r.impressions = impressions;
    return r;
}

inline RuleSpec rule(const std::string& keyword, const std::string& matchType) {
    return RuleSpec{keyword, matchType};
}

// Fresh directory under the system temp dir, removed on destruction.
class ScopedTempDir {
public:
    ScopedTempDir() {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("negator_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string write(const std::string& name, const std::string& content) const {
        const auto p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    std::vector<std::string> files() const {
        std::vector<std::string> out;
        for (const auto& entry : std::filesystem::directory_iterator(path_)) {
            out.push_back(entry.path().filename().string());
        }
        return out;
    }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace test_helpers
