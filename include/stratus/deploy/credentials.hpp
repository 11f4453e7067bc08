#pragma once

#include "stratus/agent/protocol.hpp"
#include "stratus/core/result.hpp"

#include <iosfwd>
#include <optional>

namespace stratus::deploy {

constexpr const char* kUsernameEnv = "STRATUS_ADMIN_USERNAME";
constexpr const char* kPasswordEnv = "STRATUS_ADMIN_PASSWORD";

/**
 * @brief Source of the administrator credentials of a run
 *
 * Asked once; the answer is used for both VMs and both agent sessions.
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    virtual Result<agent::Credentials> credentials() = 0;
};

class StaticCredentialProvider : public CredentialProvider {
public:
    explicit StaticCredentialProvider(agent::Credentials credentials);

    Result<agent::Credentials> credentials() override;

private:
    agent::Credentials credentials_;
};

/**
 * @brief Interactive prompt
 *
 * Echo is turned off while the password is typed when input is a terminal.
 */
class TerminalCredentialPrompt : public CredentialProvider {
public:
    TerminalCredentialPrompt(std::istream& in, std::ostream& out);

    Result<agent::Credentials> credentials() override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/**
 * @brief Credentials from STRATUS_ADMIN_USERNAME / STRATUS_ADMIN_PASSWORD
 */
std::optional<agent::Credentials> credentials_from_environment();

} // namespace stratus::deploy
