#include <fsimage/FsImage.hpp>
#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace FSI;

namespace {

enum class Command {
    Inspect,
    Dump,
    Compare,
    Verify,
    Demo
};

struct ParsedArguments {
    Command                              command = Command::Inspect;
    std::vector<std::string>             operands;
    std::optional<std::filesystem::path> output;
    std::optional<std::uint64_t>         transactionId;
    bool                                 compact       = false;
    bool                                 snapshotViews = true;
    bool                                 diffs         = true;
    bool                                 verbose       = false;
};

struct CliParseResult {
    bool                           show_help = false;
    std::string                    usage;
    std::optional<ParsedArguments> arguments;
};

auto parse_arguments(int argc, char** argv) -> std::optional<CliParseResult> {
    CliParseResult  result{};
    ParsedArguments args{};

    CLI::CommandLine cli("fsimage_tool");
    cli.add_command({"inspect", {"<image>"}, "Print the image as JSON (header, tree, snapshots, diff chains)"});
    cli.add_command({"dump", {"<image>"}, "Print the deterministic tree dump of an image"});
    cli.add_command({"compare", {"<dumpA>", "<dumpB>"}, "Compare two tree dumps; exit status 1 on the first difference"});
    cli.add_command({"verify", {"<image>"}, "Load, re-save and reload an image and compare the dumps"});
    cli.add_command({"demo", {}, "Build a sample namespace with snapshots and open files and save it"});

    cli.add_flag("--help", {.on_set = [&] { result.show_help = true; }, .help = "Show this message", .stops_parsing = true});
    cli.add_alias("-h", "--help");
    cli.add_value("--out",
                  {.on_value = [&](std::string_view value) -> CLI::CommandLine::ParseError {
                       args.output = std::filesystem::path{std::string{value}};
                       return std::nullopt;
                   },
                   .help    = "Output file (dump) or image file/directory (demo)",
                   .metavar = "<path>"});
    cli.add_alias("-o", "--out");
    cli.add_uint("--txid", {.on_value = [&](std::uint64_t value) { args.transactionId = value; },
                            .help     = "Transaction id recorded in the demo image header"});
    cli.add_flag("--compact", {.on_set = [&] { args.compact = true; }, .help = "Single-line JSON"});
    cli.add_flag("--no-views", {.on_set = [&] { args.snapshotViews = false; },
                                .help   = "Omit reconstructed snapshot views from JSON"});
    cli.add_flag("--no-diffs", {.on_set = [&] { args.diffs = false; }, .help = "Omit raw diff chains from JSON"});
    cli.add_flag("--verbose", {.on_set = [&] { args.verbose = true; },
                               .help   = "Log every tag (when built with logging; FSIMAGE_LOG filters tags)"});
    cli.add_alias("-v", "--verbose");

    result.usage = cli.usage();
    if (!cli.parse(argc, argv)) {
        std::cerr << result.usage;
        return std::nullopt;
    }
    if (cli.stopped()) {
        return result;
    }

    static constexpr std::pair<std::string_view, Command> commands[] = {
        {"inspect", Command::Inspect}, {"dump", Command::Dump}, {"compare", Command::Compare},
        {"verify", Command::Verify},   {"demo", Command::Demo},
    };
    auto const& selected = cli.command()->name;
    for (auto const& [name, command] : commands) {
        if (name == selected) {
            args.command = command;
        }
    }
    args.operands = cli.operands();
    if (args.command == Command::Demo && !args.output) {
        std::cerr << "fsimage_tool: demo requires --out\n";
        return std::nullopt;
    }
    result.arguments = std::move(args);
    return result;
}

auto report(Error const& error) -> int {
    std::cerr << "fsimage_tool: " << describeError(error) << '\n';
    return 1;
}

auto loadNamesystem(std::filesystem::path const& image, Namesystem& namesystem) -> Expected<ImageHeader> {
    return namesystem.loadImageFromFile(image);
}

auto run_inspect(ParsedArguments const& args) -> int {
    auto bytes = readBinaryFile(args.operands.front());
    if (!bytes)
        return report(bytes.error());
    ImageJsonOptions options;
    options.includeSnapshotViews = args.snapshotViews;
    options.includeDiffs         = args.diffs;
    options.indent               = args.compact ? -1 : 2;
    auto json                    = ImageJsonExporter::Export(*bytes, options);
    if (!json)
        return report(json.error());
    std::cout << *json << '\n';
    return 0;
}

auto run_dump(ParsedArguments const& args) -> int {
    Namesystem namesystem;
    if (auto loaded = loadNamesystem(args.operands.front(), namesystem); !loaded)
        return report(loaded.error());
    auto text = namesystem.dump();
    if (!args.output) {
        std::cout << text;
        return 0;
    }
    std::ofstream out(*args.output, std::ios::binary | std::ios::trunc);
    if (!out || !(out << text)) {
        return report(Error{Error::Code::IoFailure, "Failed to write " + args.output->string()});
    }
    return 0;
}

auto run_compare(ParsedArguments const& args) -> int {
    auto expected = readTextFile(args.operands[0]);
    if (!expected)
        return report(expected.error());
    auto actual = readTextFile(args.operands[1]);
    if (!actual)
        return report(actual.error());
    if (auto difference = TreeDump::compareDumps(*expected, *actual)) {
        std::cout << "Dumps differ at " << TreeDump::describeDifference(*difference) << '\n';
        return 1;
    }
    std::cout << "Dumps are identical\n";
    return 0;
}

auto run_verify(ParsedArguments const& args) -> int {
    Namesystem original;
    auto       header = loadNamesystem(args.operands.front(), original);
    if (!header)
        return report(header.error());
    auto const before = original.dump();

    CancellationToken token;
    MemoryByteSink    sink;
    auto              saved = original.saveImage(sink, token);
    if (!saved)
        return report(saved.error());

    Namesystem       reloaded;
    MemoryByteSource source(sink.bytes());
    if (auto loaded = reloaded.loadImage(source); !loaded)
        return report(loaded.error());

    if (auto difference = TreeDump::compareDumps(before, reloaded.dump())) {
        std::cout << "Round trip changed the namespace at " << TreeDump::describeDifference(*difference) << '\n';
        return 1;
    }
    std::cout << "Round trip OK: txid " << header->transactionId << ", " << std::get<ImageSaved>(*saved).bytesWritten
              << " bytes\n";
    return 0;
}

auto build_demo(Namesystem& ns) -> Expected<void> {
    auto check = [](auto&& result) -> Expected<void> {
        if (!result)
            return std::unexpected(result.error());
        return {};
    };
    auto const steps = std::vector<std::function<Expected<void>()>>{
        [&] { return check(ns.mkdirs("/d/sub1")); },
        [&] { return ns.allowSnapshots("/d"); },
        [&] { return check(ns.createSnapshot("/d", "s0")); },
        [&] { return check(ns.createFile("/d/sub1/a")); },
        [&] { return check(ns.createFile("/d/sub1/b")); },
        [&] { return check(ns.createSnapshot("/d", "s1")); },
        [&] { return check(ns.createFile("/d/sub2/c")); },
        [&] { return check(ns.createFile("/d/sub2/e")); },
        [&] { return ns.setReplication("/d/sub1/a", 1); },
        [&] { return ns.deletePath("/d/sub1/b"); },
        [&] { return check(ns.createSnapshot("/d", "s2")); },
        [&] { return ns.setOwner("/d/sub2", std::string{"demo"}, std::nullopt); },
        [&] { return ns.deletePath("/d/sub2/e"); },
    };
    for (auto const& step : steps) {
        if (auto done = step(); !done)
            return done;
    }

    auto handle = ns.create("/logs/app.log", "demo-client", CreateOptions{.blockSize = 1024});
    if (!handle)
        return std::unexpected(handle.error());
    if (auto allowed = ns.allowSnapshots("/logs"); !allowed)
        return allowed;
    if (auto written = ns.write(*handle, 1500); !written)
        return written;
    if (auto synced = ns.sync(*handle); !synced)
        return std::unexpected(synced.error());
    if (auto snapshot = ns.createSnapshot("/logs", "synced"); !snapshot)
        return std::unexpected(snapshot.error());
    // Left unsynced and open on purpose: the image records the synced length.
    return ns.write(*handle, 700);
}

auto run_demo(ParsedArguments const& args) -> int {
    Namesystem ns;
    if (auto built = build_demo(ns); !built)
        return report(built.error());

    auto target = *args.output;
    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        target /= imageFileName(args.transactionId.value_or(ns.transactionId()));
    }

    CancellationToken token;
    ImageSaveOptions  options;
    options.transactionId = args.transactionId;
    auto saved            = ns.saveImageToFile(target, token, std::move(options));
    if (!saved)
        return report(saved.error());
    std::cout << "Wrote " << target.string() << " (" << std::get<ImageSaved>(*saved).bytesWritten << " bytes)\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = parse_arguments(argc, argv);
    if (!parsed) {
        return 1;
    }
    if (parsed->show_help) {
        std::cout << parsed->usage;
        return 0;
    }
    auto const& args = *parsed->arguments;

#ifdef FSI_LOG_DEBUG
    set_thread_name("fsimage_tool");
    if (args.verbose) {
        configure_logging("1");
    } else if (char const* value = std::getenv("FSIMAGE_LOG")) {
        configure_logging(value);
    }
#endif

    int result = 1;
    switch (args.command) {
    case Command::Inspect:
        result = run_inspect(args);
        break;
    case Command::Dump:
        result = run_dump(args);
        break;
    case Command::Compare:
        result = run_compare(args);
        break;
    case Command::Verify:
        result = run_verify(args);
        break;
    case Command::Demo:
        result = run_demo(args);
        break;
    }

#ifdef FSI_LOG_DEBUG
    logger().flush();
#endif
    return result;
}
