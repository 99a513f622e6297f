#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace keypack {

// Values the command line edits between operations.
struct Settings {
    std::string key;
    std::string target;
    std::string destination;
    std::string filter = "*.*";
    bool recurse = true;
    bool remove_originals = false;
    std::size_t wipe_passes = 0;
    bool log = false;
};

enum class CommandOutcome {
    Done,
    Failed,
    Exit
};

class CommandTable;

struct Command {
    std::string identifier;
    std::string description;
    std::string example;
    // Shown by --help; empty for commands that are actions.
    std::function<std::string(const Settings&)> current_value;
    std::function<CommandOutcome(const CommandTable&, Settings&, const std::string& argument, std::ostream& out)>
        handler;
    // The argument is everything after the single separator following the
    // identifier, spaces kept, instead of the trimmed text.
    bool raw_argument = false;
};

// Ordered mapping from command identifier to handler, built at startup.
class CommandTable {
public:
    void Add(Command command);

    // Case-insensitive. Returns nullptr for unknown identifiers.
    const Command* Find(std::string_view identifier) const;

    const std::vector<Command>& Commands() const {
        return commands_;
    }

    // line is "<identifier> [argument text]". A blank line does nothing. The
    // argument is trimmed unless the command takes it raw.
    CommandOutcome Execute(const std::string& line, Settings& settings, std::ostream& out) const;

    void PrintHelp(const Settings& settings, std::ostream& out) const;

    // --key, --target, --destination, --filter, --recurse, --remove-originals,
    // --wipe-passes, --log, --encrypt, --decrypt, --help, --exit.
    static CommandTable Default();

    // Each argument starting with '-' opens a command; the arguments after it
    // are appended with single spaces. A passphrase word starting with '-'
    // therefore cannot be given on the command line, only at the prompt.
    static std::vector<std::string> GroupArguments(const std::vector<std::string>& args);

    // "true" or "false", case-insensitive.
    static bool ParseBool(std::string_view text, bool& out_value);

private:
    std::vector<Command> commands_;
};

}  // namespace keypack
