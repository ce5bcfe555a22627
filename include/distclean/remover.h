#ifndef DISTCLEAN_REMOVER_H
#define DISTCLEAN_REMOVER_H

#include <distclean/error.h>
#include <distclean/plan.h>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>


namespace distclean {
    /// Paths removed so far in one invocation, really or in a dry run.
    class VirtualRemovedSet {
    public:
        void mark(const std::filesystem::path &p) { paths_.insert(p.string()); }

        [[nodiscard]] bool contains(const std::filesystem::path &p) const { return paths_.count(p.string()) != 0; }

        /// `p` or one of its ancestors is marked
        [[nodiscard]] bool covers(const std::filesystem::path &p) const;

        std::size_t size() const { return paths_.size(); }

    private:
        std::unordered_set<std::string> paths_;
    };

    enum class CascadeState { cascading, stopped_by_non_empty, stopped_at_root, stopped_missing_parent };

    std::string_view to_string(CascadeState state);

    /// upward walk from `current` towards `root`, one directory per step
    struct Cascade {
        std::filesystem::path current, root;
        CascadeState state = CascadeState::cascading;
    };

    /// receives every removed path, in processing order
    using Sink = std::function<void(const std::string &)>;

    /// Removes the entries of a plan, then every ancestor directory left empty up to and including the entry's root.
    /// In a dry run nothing is touched but the same paths are reported, emptiness being judged against what
    /// was already (virtually) removed.
    class Remover {
    public:
        /// state of one `execute` call
        struct State {
            VirtualRemovedSet removed;
            std::vector<std::string> affected;
        };

        explicit Remover(bool dry_run, Sink sink = {})
            : dry_run(dry_run), sink(std::move(sink)) {}

        /// Process the plan in path order. Stops at the first failure, already removed paths stay removed.
        /// Returns the removed (or, in a dry run, would-be removed) paths.
        Result<std::vector<std::string>> execute(const RemovalPlan &plan) const;

        Result<void> process(const RemovalEntry &entry, State &state) const;

        /// remove `entry.path` if present and mark it as removed either way
        Result<void> remove_leaf(const RemovalEntry &entry, State &state) const;

        /// Remove `dir` if present and empty, entries already marked do not count in a dry run.
        /// Returns whether it was removed.
        Result<bool> remove_if_empty(const std::filesystem::path &dir, State &state) const;

        /// examine `c.current` and move up one level if it got removed
        Result<CascadeState> step(Cascade &c, State &state) const;

        /// exists on disk and not (virtually) removed
        bool present(const std::filesystem::path &p, const State &state) const;

    private:
        void report(const std::filesystem::path &p, State &state) const;

        bool dry_run;
        Sink sink;
    };

    Result<std::vector<std::string>> execute(const RemovalPlan &plan, bool dry_run, const Sink &sink = {});
} // namespace distclean

#endif
