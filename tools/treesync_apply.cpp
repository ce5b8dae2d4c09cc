#include "cli/CommandLine.hpp"
#include "log/TaggedLogger.hpp"
#include "patch/PatchJson.hpp"
#include "tools/PatchSession.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace {

struct ApplyToolOptions {
    std::filesystem::path                schemaPath;
    std::filesystem::path                patchPath;
    std::optional<std::filesystem::path> seedPath;
    std::optional<std::filesystem::path> outputPath;
    std::string                          rootId{TS::PatchSession::DefaultRootId};
    int                                  indent = 2;
    bool                                 help   = false;
};

auto parse_cli(int argc, char** argv) -> std::optional<ApplyToolOptions> {
    using TS::Cli::CommandLine;
    ApplyToolOptions options;

    CommandLine cli;
    cli.setProgramName("treesync_apply");
    cli.setUnknownArgumentHandler([](std::string_view token) {
        std::cerr << "Unknown flag '" << token << "'" << std::endl;
        return false;
    });

    auto pathOption = [](std::filesystem::path& target, std::string help, bool required) {
        CommandLine::ValueOption option{};
        option.help      = std::move(help);
        option.valueName = "file";
        option.required  = required;
        option.onValue   = [&target](std::string_view value) -> CommandLine::ParseError {
            if (value.empty()) {
                return std::string{"expected a file path"};
            }
            target = std::filesystem::path(std::string{value});
            return std::nullopt;
        };
        return option;
    };

    cli.addValue("--schema", pathOption(options.schemaPath, "Schema document describing classes and enums", true));
    cli.addValue("--patch", pathOption(options.patchPath, "Patch to apply", true));

    CommandLine::ValueOption seedOption{};
    seedOption.help      = "Patch applied first to build the initial tree";
    seedOption.valueName = "file";
    seedOption.onValue   = [&](std::string_view value) -> CommandLine::ParseError {
        options.seedPath = std::filesystem::path(std::string{value});
        return std::nullopt;
    };
    cli.addValue("--tree", std::move(seedOption));

    CommandLine::ValueOption outputOption{};
    outputOption.help      = "Write the unapplied patch to a file instead of stdout";
    outputOption.valueName = "file";
    outputOption.onValue   = [&](std::string_view value) -> CommandLine::ParseError {
        options.outputPath = std::filesystem::path(std::string{value});
        return std::nullopt;
    };
    cli.addValue("--output", std::move(outputOption));

    CommandLine::ValueOption rootOption{};
    rootOption.help      = "Id bound to the tree root, used as Parent by top-level additions (default \"root\")";
    rootOption.valueName = "id";
    rootOption.onValue   = [&](std::string_view value) -> CommandLine::ParseError {
        if (value.empty()) {
            return std::string{"--root-id expects a non-empty id"};
        }
        options.rootId = std::string{value};
        return std::nullopt;
    };
    cli.addValue("--root-id", std::move(rootOption));

    cli.addInt("--indent", {.onValue = [&](int value) { options.indent = value; },
                            .help    = "JSON indent (default 2, -1 for compact)",
                            .minimum = -1});
    cli.addFlag("--help", {.onSet = [&] { options.help = true; }, .help = "Show this message"});
    cli.addAlias("-h", "--help");

    bool const parsed = cli.parse(argc, argv);
    if (options.help) {
        std::cout << cli.usage();
        return options;
    }
    if (!parsed) {
        std::cerr << cli.usage();
        return std::nullopt;
    }
    return options;
}

auto read_json(std::filesystem::path const& path) -> TS::Expected<nlohmann::json> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(TS::Error{TS::Error::Code::NotFound, "cannot open " + path.string()});
    }
    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(TS::Error{TS::Error::Code::MalformedInput, "invalid JSON in " + path.string()});
    }
    return document;
}

auto read_patch(std::filesystem::path const& path) -> TS::Expected<TS::PatchSet> {
    auto document = read_json(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return TS::PatchJson::decode(*document);
}

} // namespace

int main(int argc, char** argv) {
#ifdef TS_LOG_DEBUG
    TS::set_thread_name("treesync_apply");
    bool enableLog = false;
    if (char const* envLog = std::getenv("TREESYNC_LOG")) {
        enableLog = std::strcmp(envLog, "0") != 0;
    }
    TS::set_logging_enabled(enableLog);
#endif

    auto options = parse_cli(argc, argv);
    if (!options) {
        return EXIT_FAILURE;
    }
    if (options->help) {
        return EXIT_SUCCESS;
    }

    auto schemaDocument = read_json(options->schemaPath);
    if (!schemaDocument) {
        std::cerr << "treesync_apply: " << TS::describeError(schemaDocument.error()) << "\n";
        return EXIT_FAILURE;
    }
    auto session = TS::PatchSession::fromSchemaJson(*schemaDocument, options->rootId);
    if (!session) {
        std::cerr << "treesync_apply: schema: " << TS::describeError(session.error()) << "\n";
        return EXIT_FAILURE;
    }

    if (options->seedPath) {
        auto seed = read_patch(*options->seedPath);
        if (!seed) {
            std::cerr << "treesync_apply: tree: " << TS::describeError(seed.error()) << "\n";
            return EXIT_FAILURE;
        }
        auto seeded = (*session)->apply(*seed);
        if (!seeded) {
            std::cerr << "treesync_apply: tree: " << TS::describeError(seeded.error()) << "\n";
            return EXIT_FAILURE;
        }
        if (!seeded->isEmpty()) {
            std::cerr << "treesync_apply: tree: " << seeded->countChanges() << " change(s) not applied\n";
        }
    }

    auto patch = read_patch(options->patchPath);
    if (!patch) {
        std::cerr << "treesync_apply: patch: " << TS::describeError(patch.error()) << "\n";
        return EXIT_FAILURE;
    }

    auto unapplied = (*session)->apply(*patch);
    if (!unapplied) {
        std::cerr << "treesync_apply: aborted: " << TS::describeError(unapplied.error()) << "\n";
        return 2;
    }

    auto const text = TS::PatchJson::describePatch(*unapplied, options->indent);
    if (options->outputPath) {
        std::ofstream output(*options->outputPath);
        if (!output) {
            std::cerr << "treesync_apply: cannot write " << options->outputPath->string() << "\n";
            return EXIT_FAILURE;
        }
        output << text << '\n';
    } else {
        std::cout << text << '\n';
    }
    return EXIT_SUCCESS;
}
