#include "stratus/agent/command_runner.hpp"

#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace stratus::agent {
namespace bp = boost::process;

Result<std::vector<std::string>> expand_template(const CommandTemplate& command,
                                                 const std::map<std::string, std::string>& values) {
    if (command.empty()) {
        return Err<std::vector<std::string>>(std::string("Command template is empty"));
    }

    std::vector<std::string> argv;
    argv.reserve(command.size());

    for (const auto& token : command) {
        std::string expanded;
        std::size_t i = 0;
        while (i < token.size()) {
            const char c = token[i];
            if (c == '{' && i + 1 < token.size() && token[i + 1] == '{') {
                expanded += '{';
                i += 2;
                continue;
            }
            if (c == '}' && i + 1 < token.size() && token[i + 1] == '}') {
                expanded += '}';
                i += 2;
                continue;
            }
            if (c == '{') {
                const auto close = token.find('}', i + 1);
                if (close == std::string::npos) {
                    return Err<std::vector<std::string>>("Unterminated placeholder in '" + token + "'");
                }
                const std::string key = token.substr(i + 1, close - i - 1);
                const auto it = values.find(key);
                if (it == values.end()) {
                    return Err<std::vector<std::string>>("Unknown placeholder {" + key + "} in '" + token + "'");
                }
                expanded += it->second;
                i = close + 1;
                continue;
            }
            expanded += c;
            ++i;
        }
        argv.push_back(std::move(expanded));
    }

    return Ok(std::move(argv));
}

Result<CommandOutcome> ProcessCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Err<CommandOutcome>(std::string("Nothing to run"));
    }

    boost::filesystem::path executable = argv.front();
    if (!executable.has_parent_path()) {
        executable = bp::search_path(argv.front());
        if (executable.empty()) {
            return Err<CommandOutcome>("Executable not found on PATH: " + argv.front());
        }
    }

    const std::vector<std::string> args(argv.begin() + 1, argv.end());
    spdlog::debug("Running {} with {} argument(s)", executable.string(), args.size());

    try {
        bp::ipstream output;
        bp::child child(executable, bp::args(args), (bp::std_out & bp::std_err) > output);

        std::ostringstream collected;
        std::string line;
        while (std::getline(output, line)) {
            collected << line << '\n';
        }
        child.wait();

        CommandOutcome outcome;
        outcome.exit_code = child.exit_code();
        outcome.output = collected.str();
        spdlog::debug("{} exited with {}", executable.string(), outcome.exit_code);
        return Ok(std::move(outcome));
    } catch (const bp::process_error& e) {
        return Err<CommandOutcome>("Failed to run " + executable.string() + ": " + e.what());
    }
}

} // namespace stratus::agent
