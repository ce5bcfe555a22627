#ifndef DISTCLEAN_FS_H
#define DISTCLEAN_FS_H

#include <distclean/error.h>
#include <filesystem>
#include <vector>


namespace distclean {
    /// immediate entries of `dir`, in the order the OS returns them
    Result<std::vector<std::filesystem::directory_entry>> read_dir(const std::filesystem::path &dir);

    /// does not follow symlinks
    bool is_dir(const std::filesystem::directory_entry &entry);

    /// exists on disk, a dangling symlink counts
    bool exists_on_disk(const std::filesystem::path &p);

    /// component-wise check that `p` lies below `root` and is not `root` itself
    bool is_strictly_under(const std::filesystem::path &p, const std::filesystem::path &root);
} // namespace distclean

#endif
