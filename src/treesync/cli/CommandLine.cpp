#include "cli/CommandLine.hpp"

#include <charconv>
#include <iostream>
#include <sstream>

namespace TS::Cli {

CommandLine::CommandLine() {
    unknownHandler = [this](std::string_view token) {
        logError("ignoring unknown argument '" + std::string(token) + "'");
        return true;
    };
}

void CommandLine::setProgramName(std::string_view name) {
    programName.assign(name.begin(), name.end());
}

void CommandLine::setUnknownArgumentHandler(std::function<bool(std::string_view)> handler) {
    unknownHandler = std::move(handler);
}

void CommandLine::setErrorLogger(std::function<void(std::string const&)> logger) {
    errorLogger = std::move(logger);
}

void CommandLine::addFlag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help        = std::move(option.help);
    entry.flagHandler = std::move(option.onSet);
    registerOption(std::move(entry));
}

void CommandLine::addValue(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help         = std::move(option.help);
    entry.valueName    = std::move(option.valueName);
    entry.expectsValue = true;
    entry.required     = option.required;
    entry.valueHandler = std::move(option.onValue);
    registerOption(std::move(entry));
}

void CommandLine::addInt(std::string_view name, IntOption option) {
    ValueOption valueOption{};
    valueOption.help      = std::move(option.help);
    valueOption.valueName = "n";
    valueOption.onValue   = [stored = std::string(name), minimum = option.minimum, handler = std::move(option.onValue)](
                                  std::string_view token) -> ParseError {
        int value = 0;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            return stored + " expects an integer value";
        }
        if (value < minimum) {
            return stored + " must be at least " + std::to_string(minimum);
        }
        handler(value);
        return std::nullopt;
    };
    addValue(name, std::move(valueOption));
}

void CommandLine::addAlias(std::string_view alias, std::string_view target) {
    auto targetIt = optionLookup.find(std::string(target));
    if (targetIt == optionLookup.end()) {
        logError("missing option for alias '" + std::string(target) + "'");
        hadError = true;
        return;
    }
    optionLookup.emplace(std::string(alias), targetIt->second);
}

bool CommandLine::parse(int argc, char const* const* argv) {
    hadError = false;
    for (auto& option : options) {
        option.seen = false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view                rawToken{argv[i]};
        std::string_view                name = rawToken;
        std::optional<std::string_view> attachedValue;
        if (auto equalsPos = rawToken.find('='); equalsPos != std::string_view::npos) {
            name          = rawToken.substr(0, equalsPos);
            attachedValue = rawToken.substr(equalsPos + 1);
        }

        OptionEntry* entry = findOption(name);
        if (entry == nullptr) {
            if (unknownHandler && !unknownHandler(rawToken)) {
                hadError = true;
            }
            continue;
        }
        entry->seen = true;

        if (!entry->expectsValue) {
            if (attachedValue) {
                logError(entry->name + " does not accept a value");
                hadError = true;
                continue;
            }
            if (entry->flagHandler) {
                entry->flagHandler();
            }
            continue;
        }

        std::string_view value;
        if (attachedValue) {
            value = *attachedValue;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            logError(entry->name + " requires a value");
            hadError = true;
            continue;
        }

        if (entry->valueHandler) {
            if (auto error = entry->valueHandler(value)) {
                logError(*error);
                hadError = true;
            }
        }
    }

    for (auto const& option : options) {
        if (option.required && !option.seen) {
            logError("missing required option " + option.name);
            hadError = true;
        }
    }
    return !hadError;
}

auto CommandLine::usage() const -> std::string {
    std::ostringstream out;
    out << "usage: " << (programName.empty() ? "treesync" : programName);
    for (auto const& option : options) {
        out << ' ';
        if (!option.required) {
            out << '[';
        }
        out << option.name;
        if (option.expectsValue) {
            out << " <" << option.valueName << '>';
        }
        if (!option.required) {
            out << ']';
        }
    }
    out << '\n';
    for (auto const& option : options) {
        if (!option.help.empty()) {
            out << "  " << option.name << "\t" << option.help << '\n';
        }
    }
    return out.str();
}

auto CommandLine::findOption(std::string_view name) -> OptionEntry* {
    auto it = optionLookup.find(std::string(name));
    if (it == optionLookup.end()) {
        return nullptr;
    }
    return &options[it->second];
}

void CommandLine::registerOption(OptionEntry entry) {
    options.push_back(std::move(entry));
    optionLookup.emplace(options.back().name, options.size() - 1);
}

void CommandLine::logError(std::string_view message) {
    std::string text = programName.empty() ? std::string("treesync") : programName;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (errorLogger) {
        errorLogger(text);
    } else {
        std::cerr << text << '\n';
    }
}

} // namespace TS::Cli
