#include "../../include/file_utils.hpp"
#include <random>
#include <string>
#include <system_error>

namespace imgpress {

    namespace {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        thread_local std::uniform_int_distribution<unsigned long long> dist;
    }

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.string().c_str(), mode);
    }

    std::filesystem::path make_temp_sibling(const std::filesystem::path& target) {
        const auto dir = target.parent_path();
        std::error_code ec;
        for (;;) {
            auto candidate = dir / (target.filename().string() + ".imgpress-" +
                                    std::to_string(dist(rng)) + ".tmp");
            if (!std::filesystem::exists(candidate, ec)) {
                return candidate;
            }
        }
    }

    std::optional<std::uintmax_t> file_size_or_none(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) return std::nullopt;
        return size;
    }

} // namespace imgpress
