#include <distclean/plan.h>

using namespace distclean;


Result<void> RemovalPlan::add(RemovalEntry entry) {
    auto [it, inserted] = entries_.try_emplace(entry.path, entry);
    if (inserted or it->second == entry)
        return {};

    return unexpected_errorf(errc::consistency,
                             "conflicting removal entries for {:?}: root {:?} ({}) and root {:?} ({})",
                             entry.path,
                             it->second.root,
                             it->second.is_dir ? "directory" : "file",
                             entry.root,
                             entry.is_dir ? "directory" : "file");
}

Result<RemovalPlan> distclean::plan_removals(const std::vector<BinOutput> &bins, const std::vector<DistOutput> &dists) {
    RemovalPlan plan;

    for (const auto &bin : bins)
        for (const auto &path : bin.paths)
            if (auto res = plan.add(RemovalEntry{.path = path, .root = bin.root, .is_dir = false}); not res)
                return unexpected_move(res);

    for (const auto &dist : dists)
        for (const auto &entry : dist.entries)
            if (auto res = plan.add(RemovalEntry{.path = entry.path, .root = dist.dir, .is_dir = entry.is_dir}); not res)
                return unexpected_move(res);

    return plan;
}
