#include "../../include/directory_walker.hpp"
#include "../../include/image_format.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace imgpress {

namespace {

constexpr std::string_view kTag = "walker";

constexpr std::array<std::string_view, 6> kImageExtensions = {
    ".png", ".jpg", ".jpeg", ".bmp", ".tiff", ".webp"
};

bool is_junk(const fs::path& p) {
    const auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    const auto lower = to_lower_ascii(name);
    return lower == ".ds_store" || lower == "desktop.ini";
}

bool is_regular_file_noexcept(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool is_directory_noexcept(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

// nested directories of root (root included), sorted
std::vector<fs::path> list_directories_recursive(const fs::path& root) {
    std::vector<fs::path> dirs{root};
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (is_directory_noexcept(it->path())) {
            dirs.push_back(it->path());
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Error walking " + root.string() + ": " + ec.message(), kTag);
    }
    std::ranges::sort(dirs);
    return dirs;
}

} // namespace

bool DirectoryWalker::is_candidate(const fs::path& path) {
    if (is_junk(path)) {
        return false;
    }
    const auto ext = to_lower_ascii(path.extension().string());
    return std::ranges::find(kImageExtensions, ext) != kImageExtensions.end();
}

std::vector<fs::path> DirectoryWalker::scan_directory(const fs::path& directory) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        Logger::log(LogLevel::Warning, "Directory not found: " + directory.string(), kTag);
        return files;
    }

    for (auto it = fs::directory_iterator(directory, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& p = it->path();
        if (is_regular_file_noexcept(p) && is_candidate(p)) {
            files.push_back(p);
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Error listing " + directory.string() + ": " + ec.message(), kTag);
    }

    std::ranges::sort(files);
    Logger::log(LogLevel::Info,
                "Found " + std::to_string(files.size()) + " images in " + directory.string(), kTag);
    return files;
}

std::vector<DirectoryBatch> DirectoryWalker::walk_year_tree(const YearTreeLayout& layout) {
    std::vector<DirectoryBatch> batches;
    if (!is_directory_noexcept(layout.base)) {
        Logger::log(LogLevel::Error, "Base path not found: " + layout.base.string(), kTag);
        return batches;
    }

    for (int year = layout.start_year; year <= layout.end_year; ++year) {
        const fs::path year_dir = layout.base / (layout.year_prefix + std::to_string(year));
        if (!is_directory_noexcept(year_dir)) {
            Logger::log(LogLevel::Warning,
                        "Directory for year " + std::to_string(year) + " not found: " + year_dir.string(), kTag);
            continue;
        }
        Logger::log(LogLevel::Info, "Processing year " + std::to_string(year) + "...", kTag);

        std::vector<fs::path> image_dirs;
        std::error_code ec;
        for (auto it = fs::directory_iterator(year_dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
            const auto& p = it->path();
            if (is_directory_noexcept(p) && p.filename().string().ends_with(layout.dir_suffix)) {
                image_dirs.push_back(p);
            }
        }
        if (ec) {
            Logger::log(LogLevel::Warning, "Error listing " + year_dir.string() + ": " + ec.message(), kTag);
        }
        std::ranges::sort(image_dirs);

        for (const auto& dir : image_dirs) {
            batches.push_back({dir, scan_directory(dir)});
        }
    }
    return batches;
}

std::vector<DirectoryBatch> DirectoryWalker::collect_inputs(const std::vector<fs::path>& inputs,
                                                            const bool recursive) {
    std::vector<DirectoryBatch> batches;
    std::map<fs::path, std::vector<fs::path>> loose_files;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), kTag);
            continue;
        }
        if (is_directory_noexcept(in)) {
            const auto dirs = recursive ? list_directories_recursive(in) : std::vector<fs::path>{in};
            for (const auto& dir : dirs) {
                batches.push_back({dir, scan_directory(dir)});
            }
        } else if (is_regular_file_noexcept(in) && !is_junk(in)) {
            loose_files[in.parent_path()].push_back(in);
        }
    }

    for (auto& [dir, files] : loose_files) {
        std::ranges::sort(files);
        files.erase(std::unique(files.begin(), files.end()), files.end());
        batches.push_back({dir, std::move(files)});
    }

    size_t total = 0;
    for (const auto& b : batches) total += b.files.size();
    Logger::log(LogLevel::Info,
                "Collected " + std::to_string(total) + " files in " + std::to_string(batches.size()) + " directories",
                kTag);
    return batches;
}

} // namespace imgpress
