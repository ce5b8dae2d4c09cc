#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace TS::Cli {

/**
 * Minimal long-option parser for the command-line tools.
 *
 * Options are written `--name value` or `--name=value`. Flags take no value.
 * Handlers run in argument order; a handler returning an error string marks
 * the parse as failed and the message is reported through the error logger
 * (stderr by default) prefixed with the program name. Options registered as
 * required are reported when absent. Unknown arguments are reported and
 * ignored unless an unknown-argument handler says otherwise.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    void setProgramName(std::string_view name);
    void setUnknownArgumentHandler(std::function<bool(std::string_view)> handler);
    void setErrorLogger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> onSet;
        std::string           help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> onValue;
        std::string                                 help;
        std::string                                 valueName = "value";
        bool                                        required  = false;
    };

    struct IntOption {
        std::function<void(int)> onValue;
        std::string              help;
        int                      minimum = 0;
    };

    void addFlag(std::string_view name, FlagOption option);
    void addValue(std::string_view name, ValueOption option);
    void addInt(std::string_view name, IntOption option);
    void addAlias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool hadErrors() const { return hadError; }

    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::string                                 help;
        std::string                                 valueName;
        bool                                        expectsValue = false;
        bool                                        required     = false;
        bool                                        seen         = false;
        std::function<void()>                       flagHandler;
        std::function<ParseError(std::string_view)> valueHandler;
    };

    auto findOption(std::string_view name) -> OptionEntry*;
    void registerOption(OptionEntry entry);
    void logError(std::string_view message);

    std::vector<OptionEntry>                          options;
    phmap::flat_hash_map<std::string, std::size_t>    optionLookup;
    std::string                                       programName;
    std::function<bool(std::string_view)>             unknownHandler;
    std::function<void(std::string const&)>           errorLogger;
    bool                                              hadError = false;
};

} // namespace TS::Cli
