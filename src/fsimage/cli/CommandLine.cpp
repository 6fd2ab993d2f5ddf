#include "cli/CommandLine.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <sstream>

namespace FSI::CLI {

namespace {

auto option_label(std::string const& name, std::vector<std::string> const& aliases, std::string const& metavar)
    -> std::string {
    std::string label;
    for (auto const& alias : aliases) {
        label += alias;
        label += ", ";
    }
    label += name;
    if (!metavar.empty()) {
        label.push_back(' ');
        label += metavar;
    }
    return label;
}

} // namespace

CommandLine::CommandLine(std::string program_name)
    : program_name_(std::move(program_name)) {}

void CommandLine::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void CommandLine::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name          = std::string{name};
    entry.help          = std::move(option.help);
    entry.stops_parsing = option.stops_parsing;
    entry.flag_handler  = std::move(option.on_set);
    register_option(std::move(entry));
}

void CommandLine::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name          = std::string{name};
    entry.help          = std::move(option.help);
    entry.metavar       = std::move(option.metavar);
    entry.value_handler = std::move(option.on_value);
    if (!entry.value_handler) {
        entry.value_handler = [](std::string_view) -> ParseError { return std::nullopt; };
    }
    register_option(std::move(entry));
}

void CommandLine::add_uint(std::string_view name, UIntOption option) {
    ValueOption value;
    value.help     = std::move(option.help);
    value.metavar  = std::move(option.metavar);
    value.on_value = [label = std::string{name}, handler = std::move(option.on_value)](std::string_view token) -> ParseError {
        std::uint64_t parsed = 0;
        auto const*   end    = token.data() + token.size();
        auto const    result = std::from_chars(token.data(), end, parsed);
        if (token.empty() || result.ec != std::errc{} || result.ptr != end) {
            return label + " expects an unsigned integer, got '" + std::string{token} + "'";
        }
        if (handler) {
            handler(parsed);
        }
        return std::nullopt;
    };
    add_value(name, std::move(value));
}

void CommandLine::add_alias(std::string_view alias, std::string_view target) {
    auto it = option_lookup_.find(std::string{target});
    if (it == option_lookup_.end()) {
        report("alias " + std::string{alias} + " names unknown option " + std::string{target});
        had_error_ = true;
        return;
    }
    options_[it->second].aliases.emplace_back(alias);
    option_lookup_.emplace(std::string{alias}, it->second);
}

void CommandLine::add_command(Command command) {
    commands_.push_back(std::move(command));
}

bool CommandLine::parse(int argc, char const* const* argv) {
    had_error_ = false;
    stopped_   = false;
    selected_.reset();
    positionals_.clear();
    operands_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view token{argv[i]};
        if (options_done || !looks_like_option(token)) {
            positionals_.emplace_back(token);
            continue;
        }
        if (token == "--") {
            options_done = true;
            continue;
        }

        std::optional<std::string_view> attached;
        auto                            name = token;
        if (auto equals = token.find('='); equals != std::string_view::npos) {
            name     = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto* entry = find_option(name);
        if (entry == nullptr) {
            report("unknown option '" + std::string{name} + "'");
            had_error_ = true;
            continue;
        }

        if (!entry->expects_value()) {
            if (attached) {
                report(entry->name + " does not take a value");
                had_error_ = true;
                continue;
            }
            if (entry->flag_handler) {
                entry->flag_handler();
            }
            if (entry->stops_parsing) {
                stopped_ = true;
                return true;
            }
            continue;
        }

        if (!attached) {
            if (i + 1 >= argc || looks_like_option(argv[i + 1])) {
                report(entry->name + " requires " + (entry->metavar.empty() ? "a value" : entry->metavar));
                had_error_ = true;
                continue;
            }
            attached = std::string_view{argv[++i]};
        }
        if (auto error = entry->value_handler(*attached)) {
            report(*error);
            had_error_ = true;
        }
    }

    if (!commands_.empty() && !select_command()) {
        had_error_ = true;
    }
    return !had_error_;
}

auto CommandLine::select_command() -> bool {
    if (positionals_.empty()) {
        report("missing command");
        return false;
    }
    auto const& name = positionals_.front();
    auto        it   = std::find_if(commands_.begin(), commands_.end(),
                                    [&](Command const& command) { return command.name == name; });
    if (it == commands_.end()) {
        report("unknown command '" + name + "'");
        return false;
    }
    operands_.assign(positionals_.begin() + 1, positionals_.end());
    if (operands_.size() != it->operands.size()) {
        report(name + " expects " + std::to_string(it->operands.size()) + " operand(s), got "
               + std::to_string(operands_.size()));
        return false;
    }
    selected_ = static_cast<std::size_t>(it - commands_.begin());
    return true;
}

auto CommandLine::command() const -> Command const* {
    return selected_ ? &commands_[*selected_] : nullptr;
}

auto CommandLine::usage() const -> std::string {
    std::ostringstream out;
    out << "Usage:\n";
    if (commands_.empty()) {
        out << "  " << program_name_ << " [options]\n";
    }
    for (auto const& command : commands_) {
        out << "  " << program_name_ << ' ' << command.name;
        for (auto const& operand : command.operands) {
            out << ' ' << operand;
        }
        out << " [options]\n";
    }

    if (!commands_.empty()) {
        std::size_t width = 0;
        for (auto const& command : commands_) {
            width = std::max(width, command.name.size());
        }
        out << "\nCommands:\n";
        for (auto const& command : commands_) {
            out << "  " << command.name << std::string(width - command.name.size() + 3, ' ') << command.summary << '\n';
        }
    }

    if (!options_.empty()) {
        std::vector<std::string> labels;
        std::size_t              width = 0;
        for (auto const& option : options_) {
            labels.push_back(option_label(option.name, option.aliases, option.metavar));
            width = std::max(width, labels.back().size());
        }
        out << "\nOptions:\n";
        for (std::size_t i = 0; i < options_.size(); ++i) {
            out << "  " << labels[i] << std::string(width - labels[i].size() + 3, ' ') << options_[i].help << '\n';
        }
    }
    return out.str();
}

auto CommandLine::find_option(std::string_view name) -> OptionEntry* {
    auto it = option_lookup_.find(std::string{name});
    return it == option_lookup_.end() ? nullptr : &options_[it->second];
}

void CommandLine::register_option(OptionEntry entry) {
    auto const index = options_.size();
    option_lookup_.emplace(entry.name, index);
    options_.push_back(std::move(entry));
}

void CommandLine::report(std::string_view message) {
    auto text = program_name_ + ": " + std::string{message};
    if (error_logger_) {
        error_logger_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool CommandLine::looks_like_option(std::string_view token) {
    return token.size() > 1 && token.front() == '-';
}

} // namespace FSI::CLI
