#include <spdlog/spdlog.h>
#include <distclean/remover.h>
#include <distclean/fs.h>

namespace fs = std::filesystem;
using namespace distclean;


static fs::path normalize(const fs::path &p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec)
        abs = p;

    abs = abs.lexically_normal();
    if (not abs.has_filename() and abs.has_relative_path())
        abs = abs.parent_path();
    return abs;
}

bool VirtualRemovedSet::covers(const fs::path &p) const {
    for (fs::path cur = p;; cur = cur.parent_path()) {
        if (contains(cur))
            return true;
        if (cur == cur.parent_path())
            return false;
    }
}

std::string_view distclean::to_string(CascadeState state) {
    switch (state) {
    case CascadeState::cascading:
        return "cascading";
    case CascadeState::stopped_by_non_empty:
        return "stopped by non-empty directory";
    case CascadeState::stopped_at_root:
        return "stopped at root";
    case CascadeState::stopped_missing_parent:
        return "stopped at missing directory";
    }
    return "unknown";
}

bool Remover::present(const fs::path &p, const State &state) const {
    return exists_on_disk(p) and not state.removed.covers(p);
}

void Remover::report(const fs::path &p, State &state) const {
    state.affected.push_back(p.string());
    if (sink)
        sink(state.affected.back());
}

Result<void> Remover::remove_leaf(const RemovalEntry &entry, State &state) const {
    const fs::path p = normalize(entry.path);

    if (present(p, state)) {
        if (not dry_run) {
            std::error_code ec;
            if (entry.is_dir)
                fs::remove_all(p, ec);
            else
                fs::remove(p, ec);

            if (ec)
                return unexpected_errorf(errc::io, "failed to remove {} {:?}: {}", entry.is_dir ? "directory" : "file",
                                         p.string(), ec.message());
            spdlog::info("removed {:?}", p.string());
        }
        report(p, state);
    }

    state.removed.mark(p);
    return {};
}

Result<bool> Remover::remove_if_empty(const fs::path &dir, State &state) const {
    if (not present(dir, state))
        return false;

    auto entries = read_dir(dir);
    if (not entries)
        return unexpected_move(entries);

    for (const auto &entry : *entries)
        if (not dry_run or not state.removed.contains(entry.path()))
            return false;

    if (not dry_run) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec)
            return unexpected_errorf(errc::io, "failed to remove directory {:?}: {}", dir.string(), ec.message());
        spdlog::info("removed empty directory {:?}", dir.string());
    }

    state.removed.mark(dir);
    report(dir, state);
    return true;
}

Result<CascadeState> Remover::step(Cascade &c, State &state) const {
    if (c.state != CascadeState::cascading)
        return c.state;

    if (c.current == c.root) {
        c.state = CascadeState::stopped_at_root;
    } else if (not present(c.current, state)) {
        c.state = CascadeState::stopped_missing_parent;
    } else if (auto removed = remove_if_empty(c.current, state); not removed) {
        return unexpected_move(removed);
    } else if (*removed) {
        c.current = c.current.parent_path();
    } else {
        c.state = CascadeState::stopped_by_non_empty;
    }

    return c.state;
}

Result<void> Remover::process(const RemovalEntry &entry, State &state) const {
    const fs::path root = normalize(entry.root);
    const fs::path path = normalize(entry.path);

    if (not is_strictly_under(path, root))
        return unexpected_errorf(errc::consistency, "root dir {:?} does not contain {:?}", root.string(), path.string());

    if (auto res = remove_leaf(entry, state); not res)
        return res;

    Cascade c{.current = path.parent_path(), .root = root};
    for (;;) {
        auto res = step(c, state);
        if (not res)
            return unexpected_move(res);
        if (*res != CascadeState::cascading)
            break;
    }
    spdlog::debug("cascade from {:?}: {} at {:?}", path.string(), to_string(c.state), c.current.string());

    if (auto removed = remove_if_empty(root, state); not removed)
        return unexpected_move(removed);

    return {};
}

Result<std::vector<std::string>> Remover::execute(const RemovalPlan &plan) const {
    State state;
    for (const auto &[path, entry] : plan.entries())
        if (auto res = process(entry, state); not res)
            return unexpected_move(res);

    return std::move(state.affected);
}

Result<std::vector<std::string>> distclean::execute(const RemovalPlan &plan, bool dry_run, const Sink &sink) {
    return Remover(dry_run, sink).execute(plan);
}
