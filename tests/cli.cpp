#include <gtest/gtest.h>
#include <distclean/cli/options.h>

using namespace distclean;


struct Args {
    std::vector<std::string> storage;
    std::vector<char *> argv;

    Args(std::initializer_list<std::string> args)
        : storage(args) {
        for (auto &s : storage)
            argv.push_back(s.data());
    }

    int argc() const { return static_cast<int>(argv.size()); }
    char **data() { return argv.data(); }
};

struct CleanOptions {
    std::optional<std::vector<std::string>> products;
    std::optional<std::string> root;
    bool dry_run = false;

    std::vector<cli::Option> options() {
        return {
            {.target = &products, .key_char = 'p', .key_str = "products", .is_positional = true},
            {.target = &root, .key_str = "root"},
            {.target = &dry_run, .key_char = 'n', .key_str = "dry-run"},
        };
    }
};

TEST(cli, positionals_and_flags) {
    CleanOptions opts;
    Args args = {"distclean clean", "app", "tool", "--dry-run", "--root", "/p"};
    cli::parse_or_throw("test", args.argc(), args.data(), opts.options());

    EXPECT_EQ(opts.products, (std::vector<std::string>{"app", "tool"}));
    EXPECT_EQ(opts.root, "/p");
    EXPECT_TRUE(opts.dry_run);
}

TEST(cli, defaults) {
    CleanOptions opts;
    Args args = {"distclean clean"};
    cli::parse_or_throw("test", args.argc(), args.data(), opts.options());

    EXPECT_FALSE(opts.products.has_value());
    EXPECT_FALSE(opts.root.has_value());
    EXPECT_FALSE(opts.dry_run);
}

TEST(cli, help_and_errors) {
    CleanOptions opts;

    Args help = {"distclean clean", "--help"};
    EXPECT_THROW(cli::parse_or_throw("test", help.argc(), help.data(), opts.options()), cli::parse_help);

    Args unknown = {"distclean clean", "--force"};
    EXPECT_THROW(cli::parse_or_throw("test", unknown.argc(), unknown.data(), opts.options()), cli::parse_error);
}

TEST(cli, one_of) {
    std::string command;
    const std::vector<cli::Option> options = {
        {.target = &command, .key_str = "command", .is_positional = true, .one_of = {"clean", "verify"}},
    };

    Args ok = {"distclean", "verify"};
    cli::parse_or_throw("test", ok.argc(), ok.data(), options);
    EXPECT_EQ(command, "verify");

    Args bad = {"distclean", "build"};
    EXPECT_THROW(cli::parse_or_throw("test", bad.argc(), bad.data(), options), cli::parse_error);
}

TEST(cli, missing_required_positional) {
    std::string product;
    const std::vector<cli::Option> options = {
        {.target = &product, .key_str = "product", .is_positional = true},
    };

    Args args = {"distclean verify"};
    EXPECT_THROW(cli::parse_or_throw("test", args.argc(), args.data(), options), cli::parse_error);
}

TEST(cli, tagged) {
    enum struct Subcommand { clean, verify, schema };
    struct Opts {
        cli::Tag<"subcommand,positional", Subcommand> subcommand;
        cli::Tag<"r,root,help=Specify root dir", std::optional<std::string>> root;
    } opts;

    Args args = {"distclean", "schema", "-r", "/p"};
    cli::parse_tagged("test", args.argc(), args.data(), opts);

    EXPECT_EQ(opts.subcommand(), Subcommand::schema);
    EXPECT_EQ(opts.root(), "/p");
}
