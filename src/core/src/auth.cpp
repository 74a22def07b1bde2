#include "rdx_auth.hpp"
#include "rdx_digest.hpp"
#include "rdx_errors.hpp"
#include "rdx_logger.hpp"
#include "rdx_options.hpp"

#include <algorithm>
#include <stdexcept>

namespace rdx {

const char* auth_state_to_string(AuthState state) {
    switch (state) {
        case AuthState::INIT:             return "init";
        case AuthState::CHALLENGE_ISSUED: return "challenge-issued";
        case AuthState::AUTHENTICATED:    return "authenticated";
        case AuthState::REJECTED:         return "rejected";
    }
    return "unknown";
}

// ===== Authenticator =====

Authenticator::Authenticator(std::string username)
    : username_(std::move(username))
{}

std::vector<std::string> Authenticator::accepted_digests() const {
    return supported_digests();
}

std::optional<AuthChallenge> Authenticator::get_challenge(const std::vector<std::string>& requested) {
    if (state_ != AuthState::INIT) {
        RDX_LOG_ERROR("Error: " << name() << " authentication challenge already sent");
        return std::nullopt;
    }

    std::vector<std::string> accepted = accepted_digests();
    std::vector<std::string> usable;
    for (const auto& d : requested) {
        std::string n = normalize_digest(d);
        if (std::find(accepted.begin(), accepted.end(), n) != accepted.end()) {
            usable.push_back(n);
        }
    }

    std::string digest;
    try {
        digest = choose_digest(usable);
    } catch (const UnsupportedDigestError& e) {
        RDX_LOG_ERROR("Error: " << name() << " authentication for '" << username_
                      << "' cannot proceed: " << e.what());
        state_ = AuthState::REJECTED;
        return std::nullopt;
    }

    AuthChallenge c;
    c.salt = generate_salt();
    c.digest = digest;
    c.issued_at = std::chrono::steady_clock::now();
    challenge_ = c;
    state_ = AuthState::CHALLENGE_ISSUED;
    RDX_LOG_DEBUG(name() << ": issued challenge using " << digest);
    return c;
}

bool Authenticator::authenticate(const std::string& response, const std::string& client_salt) {
    if (state_ != AuthState::CHALLENGE_ISSUED || !challenge_) {
        RDX_LOG_WARN("Warning: " << name() << " authentication response without a challenge ("
                     << auth_state_to_string(state_) << ")");
        return false;
    }

    // the challenge is single use
    AuthChallenge c = std::move(*challenge_);
    challenge_.reset();

    std::string salt = combine_salts(c.salt, client_salt);
    bool ok = false;
    try {
        ok = verify(response, salt, c.digest);
    } catch (const std::exception& e) {
        RDX_LOG_ERROR("Error: " << name() << " verification failed: " << e.what());
        ok = false;
    }

    state_ = ok ? AuthState::AUTHENTICATED : AuthState::REJECTED;
    if (ok) {
        RDX_LOG_INFO(name() << " authentication succeeded for '" << username_ << "'");
    } else {
        RDX_LOG_WARN("Warning: " << name() << " authentication failed for '" << username_ << "'");
    }
    return ok;
}

// ===== none / allow / reject =====

std::optional<AuthChallenge> NoneAuthenticator::get_challenge(const std::vector<std::string>&) {
    return std::nullopt;
}

bool NoneAuthenticator::authenticate(const std::string&, const std::string&) {
    state_ = AuthState::AUTHENTICATED;
    return true;
}

bool AllowAuthenticator::authenticate(const std::string&, const std::string&) {
    challenge_.reset();
    state_ = AuthState::AUTHENTICATED;
    return true;
}

bool RejectAuthenticator::authenticate(const std::string&, const std::string&) {
    challenge_.reset();
    state_ = AuthState::REJECTED;
    return false;
}

// ===== password =====

PasswordAuthenticator::PasswordAuthenticator(std::string username, SecureString password)
    : Authenticator(std::move(username))
    , password_(std::move(password))
{}

std::vector<std::string> PasswordAuthenticator::accepted_digests() const {
    std::vector<std::string> out;
    for (const auto& d : supported_digests()) {
        if (is_hmac_digest(d)) out.push_back(d);
    }
    return out;
}

bool PasswordAuthenticator::verify(const std::string& response, const std::string& salt,
                                   const std::string& digest) {
    if (password_.empty()) {
        RDX_LOG_ERROR("Error: password authentication has no password configured");
        return false;
    }
    return verify_digest(digest, std::string(password_.data(), password_.size()), salt, response);
}

// ===== sys =====

SystemAuthenticator::SystemAuthenticator(std::string username, std::shared_ptr<IdentityCheck> check)
    : Authenticator(std::move(username))
    , check_(std::move(check))
{}

std::vector<std::string> SystemAuthenticator::accepted_digests() const {
    return {Digest::XOR};
}

std::optional<AuthChallenge> SystemAuthenticator::get_challenge(const std::vector<std::string>& requested) {
    if (state_ == AuthState::INIT) {
        bool has_xor = std::any_of(requested.begin(), requested.end(),
                                   [](const std::string& d) { return d == Digest::XOR; });
        if (!has_xor) {
            RDX_LOG_ERROR("Error: " << name() << " authentication requires the 'xor' digest");
            state_ = AuthState::REJECTED;
            return std::nullopt;
        }
    }
    return Authenticator::get_challenge(requested);
}

bool SystemAuthenticator::verify(const std::string& response, const std::string& salt,
                                 const std::string&) {
    if (!check_) {
        RDX_LOG_ERROR("Error: no identity check configured for " << name() << " authentication");
        return false;
    }
    std::string padded = salt;
    padded.resize(response.size(), '\0');
    SecureString password(xor_bytes(response, padded));
    return check_->check(username_, std::string(password.data(), password.size()));
}

// ===== chain =====

AuthenticatorChain::AuthenticatorChain(std::string username,
                                       std::vector<std::unique_ptr<Authenticator>> members)
    : Authenticator(std::move(username))
    , members_(std::move(members))
{
    if (members_.empty()) {
        throw std::invalid_argument("authenticator chain needs at least one member");
    }
}

std::string AuthenticatorChain::name() const {
    std::string out = "chain(";
    for (size_t i = 0; i < members_.size(); ++i) {
        if (i) out += ",";
        out += members_[i]->name();
    }
    return out + ")";
}

bool AuthenticatorChain::requires_challenge() const {
    for (size_t i = current_; i < members_.size(); ++i) {
        if (members_[i]->requires_challenge()) return true;
    }
    return false;
}

bool AuthenticatorChain::settle() {
    while (current_ < members_.size() && !members_[current_]->requires_challenge()) {
        if (!members_[current_]->authenticate("", "")) {
            RDX_LOG_WARN("Warning: " << name() << ": member " << members_[current_]->name()
                         << " rejected '" << username_ << "'");
            state_ = AuthState::REJECTED;
            return false;
        }
        ++current_;
    }
    return true;
}

std::optional<AuthChallenge> AuthenticatorChain::get_challenge(const std::vector<std::string>& requested) {
    if (state_ != AuthState::INIT) {
        RDX_LOG_ERROR("Error: " << name() << " challenge requested in state "
                      << auth_state_to_string(state_));
        return std::nullopt;
    }
    if (!settle()) return std::nullopt;
    if (current_ == members_.size()) {
        state_ = AuthState::AUTHENTICATED;
        return std::nullopt;
    }
    auto c = members_[current_]->get_challenge(requested);
    if (!c) {
        state_ = AuthState::REJECTED;
        return std::nullopt;
    }
    state_ = AuthState::CHALLENGE_ISSUED;
    return c;
}

bool AuthenticatorChain::authenticate(const std::string& response, const std::string& client_salt) {
    if (state_ == AuthState::REJECTED) return false;
    if (state_ == AuthState::AUTHENTICATED) {
        // repeatable only when nothing was ever challenged
        return std::none_of(members_.begin(), members_.end(),
                            [](const std::unique_ptr<Authenticator>& m) {
                                return m->requires_challenge();
                            });
    }

    if (current_ < members_.size() && members_[current_]->requires_challenge()) {
        Authenticator* m = members_[current_].get();
        if (!m->authenticate(response, client_salt)) {
            RDX_LOG_WARN("Warning: " << name() << ": member " << m->name()
                         << " rejected '" << username_ << "'");
            state_ = AuthState::REJECTED;
            return false;
        }
        ++current_;
    }
    if (!settle()) return false;

    if (current_ == members_.size()) {
        state_ = AuthState::AUTHENTICATED;
        return true;
    }
    state_ = AuthState::INIT;
    return false;
}

// ===== AuthFactory =====

std::vector<std::string> AuthFactory::available_modes() {
    return {"none", "allow", "reject", "password", "sys"};
}

std::unique_ptr<Authenticator> AuthFactory::create(const std::string& mode,
                                                   const std::string& username,
                                                   const AuthOptions& options) {
    std::vector<std::string> names = split_list(mode);
    if (names.empty()) {
        throw std::invalid_argument("empty authentication mode");
    }

    auto make_one = [&](const std::string& n) -> std::unique_ptr<Authenticator> {
        if (n == "none")   return std::make_unique<NoneAuthenticator>(username);
        if (n == "allow")  return std::make_unique<AllowAuthenticator>(username);
        if (n == "reject") return std::make_unique<RejectAuthenticator>(username);
        if (n == "password") {
            if (options.password.empty()) {
                throw std::invalid_argument("password authentication needs auth.password");
            }
            return std::make_unique<PasswordAuthenticator>(username, SecureString(options.password));
        }
        if (n == "sys" || n == "system") {
            if (!options.identity_check) {
                throw std::invalid_argument("sys authentication needs an identity check");
            }
            return std::make_unique<SystemAuthenticator>(username, options.identity_check);
        }
        throw std::invalid_argument("unknown authentication mode: " + n);
    };

    if (names.size() == 1) {
        return make_one(names[0]);
    }
    std::vector<std::unique_ptr<Authenticator>> members;
    for (const auto& n : names) members.push_back(make_one(n));
    return std::make_unique<AuthenticatorChain>(username, std::move(members));
}

} // namespace rdx
