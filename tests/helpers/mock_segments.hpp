#pragma once

/**
 * @file mock_segments.hpp
 * @brief In-memory segment store for testing the merge engine.
 *
 * Provides a StreamFactory backed by std::istringstream so merge tests do not
 * touch the filesystem.
 */

#include <d2pak/archive/merge_reader.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace test_helpers {

/**
 * @brief Map of path -> segment bytes, with open bookkeeping.
 *
 * Usage:
 *   MockSegments segs;
 *   segs.add("data/a.d2p", make_linked_segment(files, "b.d2p"));
 *   reader.merge("data/a.d2p", segs.factory(), &err);
 *   REQUIRE(segs.open_count("data/b.d2p") == 1);
 */
class MockSegments {
public:
    void add(const std::filesystem::path& path, std::vector<std::uint8_t> data) {
        segments_[key(path)] = std::move(data);
    }

    d2pak::archive::StreamFactory factory() {
        return [this](const std::filesystem::path& path) -> std::unique_ptr<std::istream> {
            const std::string k = key(path);
            opened_.push_back(k);

            auto it = segments_.find(k);
            if (it == segments_.end()) {
                return nullptr;
            }
            const auto& data = it->second;
            return std::make_unique<std::istringstream>(
                std::string(reinterpret_cast<const char*>(data.data()), data.size()),
                std::ios::in | std::ios::binary);
        };
    }

    /** @brief Paths passed to the factory, in call order. */
    const std::vector<std::string>& opened() const { return opened_; }

    std::size_t open_count(const std::filesystem::path& path) const {
        const std::string k = key(path);
        std::size_t n = 0;
        for (const auto& p : opened_) {
            if (p == k) ++n;
        }
        return n;
    }

private:
    static std::string key(const std::filesystem::path& path) {
        return path.lexically_normal().generic_string();
    }

    std::unordered_map<std::string, std::vector<std::uint8_t>> segments_;
    std::vector<std::string> opened_;
};

} // namespace test_helpers
