#ifndef DISTCLEAN_CLI_OPTIONS_H
#define DISTCLEAN_CLI_OPTIONS_H

#include <cxxopts.hpp>
#include <fmt/ranges.h>
#include <rfl.hpp>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>


namespace distclean::cli {
    using Generic = std::variant<bool *,
                                 std::string *,
                                 std::optional<std::string> *,
                                 std::vector<std::string> *,
                                 std::optional<std::vector<std::string>> *>;

    struct Option {
        Generic target;
        char key_char = '\0';
        std::string key_str, help;
        bool is_positional = false;
        std::unordered_set<std::string> one_of = {};
    };

    class parse_error : public std::exception {
    public:
        explicit parse_error(std::string msg)
            : msg(std::move(msg)) {}

        [[nodiscard]] const char *what() const noexcept override { return msg.c_str(); }

    private:
        std::string msg;
    };

    /// thrown when -h/--help is given, what() is the help text
    class parse_help : public std::exception {
    public:
        explicit parse_help(std::string msg)
            : msg(std::move(msg)) {}

        [[nodiscard]] const char *what() const noexcept override { return msg.c_str(); }

    private:
        std::string msg;
    };
} // namespace distclean::cli


namespace distclean::cli::detail {
    template <typename T>
    struct is_optional : std::false_type {};

    template <typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template <typename T>
    void visitor_setup(const T *target, cxxopts::OptionAdder &add, const Option &opt) {
        std::shared_ptr<cxxopts::Value> val;
        std::string help = opt.help;
        if constexpr (std::is_same_v<T, bool>) {
            val = cxxopts::value<bool>();
        } else if constexpr (is_optional<T>::value) {
            val = cxxopts::value<typename T::value_type>();
            if constexpr (std::is_same_v<typename T::value_type, std::string>)
                if (target->has_value())
                    help = fmt::format("{}{}(default: {})", help, help.empty() ? "" : " ", target->value());
        } else {
            val = cxxopts::value<T>();
            help = fmt::format("{}{}(required)", help, help.empty() ? "" : " ");
        }

        if (not opt.one_of.empty())
            help = fmt::format("{}{}(value: {{{}}})", help, help.empty() ? "" : " ", fmt::join(opt.one_of, ", "));

        std::string key = opt.key_char == '\0' ? opt.key_str : fmt::format("{},{}", opt.key_char, opt.key_str);
        add(key, help, val);
    }

    template <typename T>
    void visitor_target(T *target, const cxxopts::ParseResult &parser, const Option &opt) {
        if constexpr (is_optional<T>::value) {
            if (parser.count(opt.key_str))
                *target = parser[opt.key_str].as<typename T::value_type>();
        } else if constexpr (std::is_same_v<T, bool>) {
            *target = parser[opt.key_str].as<T>();
        } else {
            if (parser.count(opt.key_str) == 0)
                throw parse_error(fmt::format("Missing required option {:?}", opt.key_str));
            *target = parser[opt.key_str].as<T>();
        }

        if constexpr (std::is_same_v<T, std::string>) {
            if (not opt.one_of.empty() and opt.one_of.count(*target) == 0)
                throw parse_error(fmt::format("{:?} is not one of {}", *target, opt.one_of));
        }
    }
} // namespace distclean::cli::detail


namespace distclean::cli {
    /// parse `argv` into the targets of `opts`, returns the unmatched arguments
    inline std::vector<std::string> parse_or_throw(const std::string &app_name, int argc, char **argv, const std::vector<Option> &opts) {
        cxxopts::Options options(argv[0], app_name);

        auto add = options.add_options();
        std::vector<std::string> positionals;
        for (const auto &opt : opts) {
            std::visit([&](auto *target) { detail::visitor_setup(target, add, opt); }, opt.target);
            if (opt.is_positional)
                positionals.push_back(opt.key_str);
        }
        add("h,help", "Print help");

        if (not positionals.empty()) {
            options.parse_positional(positionals);
            options.positional_help(fmt::format("<{}>", fmt::join(positionals, "> <")));
            options.show_positional_help();
        }

        try {
            auto parser = options.parse(argc, argv);
            if (parser.count("help"))
                throw parse_help(options.help());

            for (const auto &opt : opts)
                std::visit([&](auto *target) { detail::visitor_target(target, parser, opt); }, opt.target);
            return parser.unmatched();
        } catch (const cxxopts::exceptions::exception &e) {
            throw parse_error(fmt::format("Failed to parse options: {}", e.what()));
        }
    }

    /// like `parse_or_throw`, but prints help or errors and exits
    inline std::vector<std::string> parse(const std::string &app_name, int argc, char **argv, const std::vector<Option> &opts) {
        try {
            return parse_or_throw(app_name, argc, argv, opts);
        } catch (const parse_help &e) {
            fmt::print(stderr, "{}\n", e.what());
            exit(0);
        } catch (const parse_error &e) {
            fmt::print(stderr, "{}\n", e.what());
            exit(1);
        }
    }

    template <rfl::internal::StringLiteral name, typename T>
    using Tag = rfl::Rename<name, T>;

    /// Parse into a struct whose fields are all `Tag`ged with "<short>,<long>,positional,help=<text>".
    /// Enum fields take the name of one of their enumerators.
    /// @example
    /// ```c++
    /// struct Opts {
    ///     distclean::cli::Tag<"command,positional,help=What to do", Command> command;
    ///     distclean::cli::Tag<"r,root", std::optional<std::string>> root;
    /// };
    /// ```
    template <typename T>
    std::vector<std::string> parse_tagged(const std::string &app_name, int argc, char **argv, T &options) {
        // backing storage for enum fields, parsed as strings
        std::unordered_map<std::string_view, std::string> enums;
        std::vector<Option> opts;

        auto view = rfl::to_view(options);
        view.apply([&](auto &&f) {
            using V = std::remove_cvref_t<decltype(f.value()->value())>;
            Option opt{};
            std::string_view spec = f.name();

            if constexpr (std::is_enum_v<V>) {
                opt.target = &(enums[spec] = rfl::enum_to_string(f.value()->value()));
                rfl::get_enumerators<V>().apply([&](const auto &e) { opt.one_of.emplace(std::string(e.name())); });
            } else {
                opt.target = &f.value()->value();
            }

            while (not spec.empty()) {
                auto pos = spec.find(',');
                std::string_view p = spec.substr(0, pos);
                spec = pos == std::string_view::npos ? std::string_view{} : spec.substr(pos + 1);

                if (p.size() == 1 and std::isalpha(static_cast<unsigned char>(p[0])))
                    opt.key_char = p[0];
                else if (p.starts_with("help="))
                    opt.help = p.substr(5);
                else if (p == "positional")
                    opt.is_positional = true;
                else if (not p.empty())
                    opt.key_str = p;
            }
            opts.push_back(std::move(opt));
        });

        auto rest = parse(app_name, argc, argv, opts);

        view.apply([&](auto &&f) {
            using V = std::remove_cvref_t<decltype(f.value()->value())>;
            if constexpr (std::is_enum_v<V>)
                f.value()->value() = rfl::string_to_enum<V>(enums.at(f.name())).value();
        });
        return rest;
    }
} // namespace distclean::cli

#endif
