#include <iostream>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#endif

#include "keypack/command_table.hpp"

namespace {

constexpr const char* kPrompt = "keypack-> ";

#ifdef _WIN32
bool WideToUtf8(const wchar_t* input, std::string& out) {
    out.clear();
    if (input == nullptr) {
        return false;
    }
    const int required = WideCharToMultiByte(CP_UTF8, 0, input, -1, nullptr, 0, nullptr, nullptr);
    if (required <= 0) {
        return false;
    }
    std::vector<char> converted(static_cast<std::size_t>(required), '\0');
    const int written = WideCharToMultiByte(CP_UTF8, 0, input, -1, converted.data(), required, nullptr, nullptr);
    if (written <= 0) {
        return false;
    }
    out.assign(converted.data(), static_cast<std::size_t>(written - 1));
    return true;
}

bool BuildUtf8ArgsFromCommandLine(std::vector<std::string>& out_args) {
    out_args.clear();
    int wide_argc = 0;
    LPWSTR* wide_argv = CommandLineToArgvW(GetCommandLineW(), &wide_argc);
    if (wide_argv == nullptr || wide_argc <= 0) {
        return false;
    }

    bool ok = true;
    for (int i = 0; i < wide_argc && ok; ++i) {
        std::string converted;
        ok = WideToUtf8(wide_argv[i], converted);
        out_args.push_back(std::move(converted));
    }
    LocalFree(wide_argv);
    return ok;
}
#endif

// Runs the grouped command line in order. Exit status 0 only if no command
// failed.
int RunQueued(const keypack::CommandTable& table, const std::vector<std::string>& commands) {
    keypack::Settings settings;
    bool all_succeeded = true;
    for (const std::string& line : commands) {
        std::cout << kPrompt << line << "\n";
        const keypack::CommandOutcome outcome = table.Execute(line, settings, std::cout);
        if (outcome == keypack::CommandOutcome::Failed) {
            all_succeeded = false;
        }
        if (outcome == keypack::CommandOutcome::Exit) {
            break;
        }
        std::cout << "\n";
    }
    return all_succeeded ? 0 : 1;
}

int RunInteractive(const keypack::CommandTable& table) {
    keypack::Settings settings;
    std::string line;
    for (;;) {
        std::cout << kPrompt << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }
        if (table.Execute(line, settings, std::cout) == keypack::CommandOutcome::Exit) {
            break;
        }
        std::cout << "\n";
    }
    return 0;
}

}  // namespace

int RunCliMain(const int argc, char* argv[]) {
    const keypack::CommandTable table = keypack::CommandTable::Default();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    if (args.empty()) {
        return RunInteractive(table);
    }
    return RunQueued(table, keypack::CommandTable::GroupArguments(args));
}

#ifdef _WIN32
int main(const int argc, char* argv[]) {
    std::vector<std::string> utf8_args;
    if (BuildUtf8ArgsFromCommandLine(utf8_args)) {
        std::vector<char*> utf8_argv;
        utf8_argv.reserve(utf8_args.size());
        for (auto& arg : utf8_args) {
            utf8_argv.push_back(arg.data());
        }
        return RunCliMain(static_cast<int>(utf8_argv.size()), utf8_argv.data());
    }
    return RunCliMain(argc, argv);
}
#else
int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}
#endif
