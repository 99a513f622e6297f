#include "keypack/command_table.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "keypack/pack_session.hpp"

namespace keypack {

namespace {

constexpr std::size_t kHelpColumn = 22;

char FoldAscii(const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool EqualsIgnoreCase(const std::string_view lhs, const std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](const char a, const char b) {
               return FoldAscii(a) == FoldAscii(b);
           });
}

std::string Trim(const std::string& value) {
    const auto is_space = [](const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    const auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    const auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string UnquotePathArg(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void CliLog(const Settings& settings, const std::string& message) {
    if (!settings.log) {
        return;
    }
    std::cerr << "[log] " << message << "\n";
}

std::string ShowBool(const bool value) {
    return value ? "true" : "false";
}

std::string ShowText(const std::string& value) {
    return value.empty() ? "<not set>" : value;
}

// Setters for the string fields.
Command TextSetter(
    std::string identifier,
    std::string description,
    std::string example,
    std::string Settings::*field,
    const bool is_path) {
    Command command;
    command.identifier = std::move(identifier);
    command.description = std::move(description);
    command.example = std::move(example);
    command.current_value = [field](const Settings& settings) { return ShowText(settings.*field); };
    command.handler = [field, is_path](const CommandTable&, Settings& settings, const std::string& argument,
                                       std::ostream&) {
        settings.*field = is_path ? UnquotePathArg(argument) : argument;
        return CommandOutcome::Done;
    };
    return command;
}

Command BoolSetter(std::string identifier, std::string description, std::string example, bool Settings::*field) {
    Command command;
    command.identifier = std::move(identifier);
    command.description = std::move(description);
    command.example = std::move(example);
    command.current_value = [field](const Settings& settings) { return ShowBool(settings.*field); };
    command.handler = [field](const CommandTable&, Settings& settings, const std::string& argument,
                              std::ostream& out) {
        bool value = false;
        if (!CommandTable::ParseBool(argument, value)) {
            out << "Invalid value '" << argument << "', expected true or false\n";
            return CommandOutcome::Failed;
        }
        settings.*field = value;
        return CommandOutcome::Done;
    };
    return command;
}

bool ParseCount(const std::string& text, std::size_t& out_value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](const char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
        return false;
    }
    try {
        const unsigned long long parsed = std::stoull(text);
        if (parsed > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) {
            return false;
        }
        out_value = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

SessionOptions SessionFor(const Settings& settings, std::ostream& out) {
    SessionOptions options;
    options.remove_originals = settings.remove_originals;
    options.wipe_passes = settings.wipe_passes;
    options.output = [&out](const std::string& line) { out << line << "\n"; };
    return options;
}

CommandOutcome RunEncrypt(const CommandTable&, Settings& settings, const std::string&, std::ostream& out) {
    if (settings.target.empty() || settings.destination.empty()) {
        out << "Both --target and --destination must be set before --encrypt\n";
        return CommandOutcome::Failed;
    }
    CliLog(settings, "Encrypting '" + settings.target + "' into '" + settings.destination + "'");
    const bool ok = PackSession::Encrypt(
        settings.key, settings.target, settings.destination, settings.recurse, settings.filter,
        SessionFor(settings, out));
    CliLog(settings, ok ? "Encryption succeeded" : "Encryption failed");
    return ok ? CommandOutcome::Done : CommandOutcome::Failed;
}

CommandOutcome RunDecrypt(const CommandTable&, Settings& settings, const std::string&, std::ostream& out) {
    if (settings.target.empty() || settings.destination.empty()) {
        out << "Both --target and --destination must be set before --decrypt\n";
        return CommandOutcome::Failed;
    }
    CliLog(settings, "Decrypting '" + settings.target + "' into '" + settings.destination + "'");
    const bool ok = PackSession::Decrypt(
        settings.key, settings.target, settings.destination, settings.recurse, settings.filter,
        SessionFor(settings, out));
    CliLog(settings, ok ? "Decryption succeeded" : "Decryption failed");
    return ok ? CommandOutcome::Done : CommandOutcome::Failed;
}

}  // namespace

void CommandTable::Add(Command command) {
    commands_.push_back(std::move(command));
}

const Command* CommandTable::Find(const std::string_view identifier) const {
    for (const Command& command : commands_) {
        if (EqualsIgnoreCase(command.identifier, identifier)) {
            return &command;
        }
    }
    return nullptr;
}

CommandOutcome CommandTable::Execute(const std::string& line, Settings& settings, std::ostream& out) const {
    const std::string text = Trim(line);
    if (text.empty()) {
        return CommandOutcome::Done;
    }

    const std::size_t split = text.find_first_of(" \t");
    const std::string identifier = text.substr(0, split);

    const Command* command = Find(identifier);
    if (command == nullptr) {
        out << "Unknown command '" << text << "', use '--help' to see available options\n";
        return CommandOutcome::Failed;
    }

    std::string argument;
    if (command->raw_argument) {
        const std::size_t start = line.find(identifier) + identifier.size() + 1U;
        if (start < line.size()) {
            argument = line.substr(start);
        }
    } else if (split != std::string::npos) {
        argument = Trim(text.substr(split));
    }
    return command->handler(*this, settings, argument, out);
}

void CommandTable::PrintHelp(const Settings& settings, std::ostream& out) const {
    out << "keypack - pack files into an encrypted, compressed archive\n\n";
    out << "Usage:\n";
    out << "  keypack [--command [value...]]...    run the commands in order, then exit\n";
    out << "  keypack                               read commands from standard input\n\n";
    out << "Commands:\n";
    for (const Command& command : commands_) {
        out << "  " << command.identifier;
        const std::size_t used = command.identifier.size() + 2U;
        out << std::string(used < kHelpColumn ? kHelpColumn - used : 1U, ' ') << command.description << "\n";
        out << std::string(kHelpColumn, ' ') << "Example: " << command.example << "\n";
        if (command.current_value) {
            out << std::string(kHelpColumn, ' ') << "Current: " << command.current_value(settings) << "\n";
        }
    }
}

CommandTable CommandTable::Default() {
    CommandTable table;

    Command key;
    key.identifier = "--key";
    key.description =
        "Passphrase used to encrypt or decrypt; taken as typed after one space, spaces included. On the command "
        "line a word starting with '-' starts the next command";
    key.example = "--key correct horse battery staple";
    key.current_value = [](const Settings& settings) { return settings.key.empty() ? "<not set>" : "<set>"; };
    key.handler = [](const CommandTable&, Settings& settings, const std::string& argument, std::ostream&) {
        settings.key = argument;
        return CommandOutcome::Done;
    };
    key.raw_argument = true;
    table.Add(std::move(key));

    table.Add(TextSetter(
        "--target", "File or directory to encrypt, or the archive to decrypt", "--target /home/me/documents",
        &Settings::target, true));
    table.Add(TextSetter(
        "--destination", "Archive file to create, or the directory to decrypt into",
        "--destination /home/me/documents.kpk", &Settings::destination, true));
    table.Add(TextSetter(
        "--filter", "File name pattern selecting files inside a target directory", "--filter *.txt",
        &Settings::filter, false));
    table.Add(BoolSetter(
        "--recurse", "Include files in subdirectories of a target directory", "--recurse false", &Settings::recurse));
    table.Add(BoolSetter(
        "--remove-originals", "Delete the inputs after a successful operation", "--remove-originals true",
        &Settings::remove_originals));

    Command passes;
    passes.identifier = "--wipe-passes";
    passes.description = "Overwrite passes applied to originals before they are removed (0 = plain delete)";
    passes.example = "--wipe-passes 3";
    passes.current_value = [](const Settings& settings) { return std::to_string(settings.wipe_passes); };
    passes.handler = [](const CommandTable&, Settings& settings, const std::string& argument, std::ostream& out) {
        std::size_t value = 0;
        if (!ParseCount(argument, value)) {
            out << "Invalid value '" << argument << "', expected a non-negative number\n";
            return CommandOutcome::Failed;
        }
        settings.wipe_passes = value;
        return CommandOutcome::Done;
    };
    table.Add(std::move(passes));

    Command log;
    log.identifier = "--log";
    log.description = "Show diagnostic logs on standard error";
    log.example = "--log true";
    log.current_value = [](const Settings& settings) { return ShowBool(settings.log); };
    log.handler = [](const CommandTable&, Settings& settings, const std::string& argument, std::ostream& out) {
        if (argument.empty()) {
            settings.log = true;
            return CommandOutcome::Done;
        }
        bool value = false;
        if (!CommandTable::ParseBool(argument, value)) {
            out << "Invalid value '" << argument << "', expected true or false\n";
            return CommandOutcome::Failed;
        }
        settings.log = value;
        return CommandOutcome::Done;
    };
    table.Add(std::move(log));

    Command encrypt;
    encrypt.identifier = "--encrypt";
    encrypt.description = "Pack --target into the archive at --destination";
    encrypt.example = "--encrypt";
    encrypt.handler = RunEncrypt;
    table.Add(std::move(encrypt));

    Command decrypt;
    decrypt.identifier = "--decrypt";
    decrypt.description = "Unpack the archive at --target into the directory --destination";
    decrypt.example = "--decrypt";
    decrypt.handler = RunDecrypt;
    table.Add(std::move(decrypt));

    Command help;
    help.identifier = "--help";
    help.description = "Show this help";
    help.example = "--help";
    help.handler = [](const CommandTable& self, Settings& settings, const std::string&, std::ostream& out) {
        self.PrintHelp(settings, out);
        return CommandOutcome::Done;
    };
    table.Add(std::move(help));

    Command quit;
    quit.identifier = "--exit";
    quit.description = "Leave the interactive prompt";
    quit.example = "--exit";
    quit.handler = [](const CommandTable&, Settings&, const std::string&, std::ostream&) {
        return CommandOutcome::Exit;
    };
    table.Add(std::move(quit));

    return table;
}

std::vector<std::string> CommandTable::GroupArguments(const std::vector<std::string>& args) {
    std::vector<std::string> grouped;
    for (const std::string& arg : args) {
        if (grouped.empty() || (!arg.empty() && arg.front() == '-')) {
            grouped.push_back(arg);
        } else {
            grouped.back() += " " + arg;
        }
    }
    return grouped;
}

bool CommandTable::ParseBool(const std::string_view text, bool& out_value) {
    if (EqualsIgnoreCase(text, "true")) {
        out_value = true;
        return true;
    }
    if (EqualsIgnoreCase(text, "false")) {
        out_value = false;
        return true;
    }
    return false;
}

}  // namespace keypack
