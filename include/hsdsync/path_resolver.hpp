#pragma once

#include <filesystem>
#include <string>

namespace hsdsync {

struct StoragePolicy {
    std::filesystem::path base_path{"./himawari_data"};
    bool organize_by_time{true};
    bool organize_by_band{false};
    bool keep_original_structure{false};
    std::string temp_suffix{".downloading"};
};

struct LocalPaths {
    std::filesystem::path final_path;
    std::filesystem::path temp_path;
};

class PathResolver {
public:
    explicit PathResolver(StoragePolicy policy);

    // Same remote path and policy always give the same result. Filenames
    // outside the HSD grammar land directly under the base directory.
    [[nodiscard]] std::filesystem::path finalPath(const std::string& remote_path) const;
    [[nodiscard]] std::filesystem::path tempPath(const std::filesystem::path& final_path) const;
    [[nodiscard]] LocalPaths resolve(const std::string& remote_path) const;

    [[nodiscard]] bool isTempFile(const std::filesystem::path& path) const;
    [[nodiscard]] const StoragePolicy& policy() const noexcept { return policy_; }

private:
    StoragePolicy policy_;
};

} // namespace hsdsync
