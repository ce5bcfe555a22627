#ifndef DISTCLEAN_PLAN_H
#define DISTCLEAN_PLAN_H

#include <distclean/error.h>
#include <distclean/dist_match.h>
#include <map>
#include <set>
#include <string>
#include <vector>


namespace distclean {
    struct RemovalEntry {
        std::string path;
        /// upper boundary of the cascade, removable itself once empty
        std::string root;
        bool is_dir = false;

        bool operator==(const RemovalEntry &) const = default;
    };

    /// Paths to remove, keyed and ordered by path.
    class RemovalPlan {
    public:
        /// adding the same entry twice is a no-op, the same path with another root or kind is a consistency error
        Result<void> add(RemovalEntry entry);

        const std::map<std::string, RemovalEntry> &entries() const { return entries_; }
        bool empty() const { return entries_.empty(); }
        std::size_t size() const { return entries_.size(); }

    private:
        std::map<std::string, RemovalEntry> entries_;
    };

    /// binaries found below one bin output root
    struct BinOutput {
        std::string root;
        std::set<std::string> paths;
    };

    /// artifacts found in one distribution output directory
    struct DistOutput {
        std::string dir;
        std::vector<DistEntry> entries;
    };

    Result<RemovalPlan> plan_removals(const std::vector<BinOutput> &bins, const std::vector<DistOutput> &dists);
} // namespace distclean

#endif
