#include <distclean/fs.h>
#include <algorithm>
#include <iterator>

namespace fs = std::filesystem;
using namespace distclean;


Result<std::vector<fs::directory_entry>> distclean::read_dir(const fs::path &dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
        return unexpected_errorf(errc::io, "failed to read directory {:?}: {}", dir.string(), ec.message());

    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        entries.push_back(*it);
    }
    if (ec)
        return unexpected_errorf(errc::io, "failed to read directory {:?}: {}", dir.string(), ec.message());

    return entries;
}

bool distclean::is_dir(const fs::directory_entry &entry) {
    std::error_code ec;
    return entry.symlink_status(ec).type() == fs::file_type::directory;
}

bool distclean::exists_on_disk(const fs::path &p) {
    std::error_code ec;
    auto type = fs::symlink_status(p, ec).type();
    return type != fs::file_type::not_found and type != fs::file_type::none;
}

bool distclean::is_strictly_under(const fs::path &p, const fs::path &root) {
    const fs::path a = p.lexically_normal(), b = root.lexically_normal();

    // a trailing separator leaves an empty last component
    auto b_end = b.end();
    if (b_end != b.begin() and std::prev(b_end)->empty())
        --b_end;

    auto [ia, ib] = std::mismatch(a.begin(), a.end(), b.begin(), b_end);
    if (ib != b_end)
        return false;

    return ia != a.end() and not ia->empty();
}
