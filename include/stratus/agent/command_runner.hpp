#pragma once

#include "stratus/agent/protocol.hpp"
#include "stratus/core/result.hpp"

#include <map>
#include <string>
#include <vector>

namespace stratus::agent {

using CommandTemplate = std::vector<std::string>;

/**
 * @brief Substitute {placeholder} tokens in an argv template
 *
 * Every placeholder must have a value; an unknown one is an error so a
 * catalog typo never reaches the process table. "{{" and "}}" emit literal
 * braces.
 */
Result<std::vector<std::string>> expand_template(const CommandTemplate& command,
                                                 const std::map<std::string, std::string>& values);

/**
 * @brief Executes a fully expanded argv
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @return exit code and combined output; an error only when the process
     *         could not be started
     */
    virtual Result<CommandOutcome> run(const std::vector<std::string>& argv) = 0;
};

/**
 * @brief Runs commands as child processes with Boost.Process
 *
 * argv[0] is looked up on PATH when it is not a path. No shell is involved.
 */
class ProcessCommandRunner : public CommandRunner {
public:
    Result<CommandOutcome> run(const std::vector<std::string>& argv) override;
};

} // namespace stratus::agent
