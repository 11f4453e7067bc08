#include "stratus/deploy/credentials.hpp"

#include <termios.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace stratus::deploy {

namespace {

// Restores the terminal mode on scope exit
class EchoGuard {
public:
    EchoGuard() {
        if (!::isatty(STDIN_FILENO) || ::tcgetattr(STDIN_FILENO, &saved_) != 0) {
            return;
        }
        termios silent = saved_;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    ~EchoGuard() {
        if (active_) {
            ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    bool active() const { return active_; }

private:
    termios saved_{};
    bool active_ = false;
};

} // namespace

StaticCredentialProvider::StaticCredentialProvider(agent::Credentials credentials)
    : credentials_(std::move(credentials)) {
}

Result<agent::Credentials> StaticCredentialProvider::credentials() {
    if (credentials_.empty()) {
        return Err<agent::Credentials>(std::string("No administrator username configured"));
    }
    return Ok(credentials_);
}

TerminalCredentialPrompt::TerminalCredentialPrompt(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out) {
}

Result<agent::Credentials> TerminalCredentialPrompt::credentials() {
    agent::Credentials credentials;

    out_ << "Administrator username: " << std::flush;
    if (!std::getline(in_, credentials.username) || credentials.username.empty()) {
        return Err<agent::Credentials>(std::string("No administrator username entered"));
    }

    out_ << "Administrator password: " << std::flush;
    {
        EchoGuard guard;
        if (!std::getline(in_, credentials.password)) {
            return Err<agent::Credentials>(std::string("No administrator password entered"));
        }
        if (guard.active()) {
            out_ << '\n';
        }
    }
    return Ok(credentials);
}

std::optional<agent::Credentials> credentials_from_environment() {
    const char* username = std::getenv(kUsernameEnv);
    if (!username || *username == '\0') {
        return std::nullopt;
    }
    const char* password = std::getenv(kPasswordEnv);
    return agent::Credentials{username, password ? password : ""};
}

} // namespace stratus::deploy
