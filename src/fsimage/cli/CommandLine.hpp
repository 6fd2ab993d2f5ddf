#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace FSI::CLI {

/**
 * Option and subcommand parser for the fsimage command line tools.
 *
 * Options are registered with callbacks; `--name value` and `--name=value`
 * are both accepted and `--` ends option parsing. When subcommands are
 * registered the first positional selects one and the remaining positionals
 * become its operands, whose count is checked against the registration.
 * usage() renders the registered commands and options.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    struct FlagOption {
        std::function<void()> on_set;
        std::string           help;
        // Stops parsing successfully once seen, skipping command checks (--help).
        bool stops_parsing = false;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        std::string                                 help;
        std::string                                 metavar = "<value>";
    };

    struct UIntOption {
        std::function<void(std::uint64_t)> on_value;
        std::string                        help;
        std::string                        metavar = "<n>";
    };

    struct Command {
        std::string              name;
        std::vector<std::string> operands; // operand placeholders, e.g. "<image>"
        std::string              summary;
    };

    explicit CommandLine(std::string program_name = "fsimage");

    void set_error_logger(std::function<void(std::string const&)> logger);

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_uint(std::string_view name, UIntOption option);
    void add_alias(std::string_view alias, std::string_view target);
    void add_command(Command command);

    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool had_errors() const { return had_error_; }
    // True when a stops_parsing flag ended the parse.
    [[nodiscard]] bool stopped() const { return stopped_; }

    [[nodiscard]] auto command() const -> Command const*;
    [[nodiscard]] auto operands() const -> std::vector<std::string> const& { return operands_; }
    [[nodiscard]] auto positionals() const -> std::vector<std::string> const& { return positionals_; }

    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::vector<std::string>                    aliases;
        std::string                                 help;
        std::string                                 metavar;
        bool                                        stops_parsing = false;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;

        [[nodiscard]] bool expects_value() const { return static_cast<bool>(value_handler); }
    };

    auto find_option(std::string_view name) -> OptionEntry*;
    void register_option(OptionEntry entry);
    auto select_command() -> bool;
    void report(std::string_view message);
    static bool looks_like_option(std::string_view token);

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::vector<Command>                         commands_;
    std::optional<std::size_t>                   selected_;
    std::vector<std::string>                     positionals_;
    std::vector<std::string>                     operands_;
    std::string                                  program_name_;
    std::function<void(std::string const&)>      error_logger_;
    bool                                         had_error_ = false;
    bool                                         stopped_   = false;
};

} // namespace FSI::CLI
