#pragma once

/**
 * @file rdx_auth.hpp
 * @brief Challenge/response authenticators
 *
 * Lifecycle: INIT -> CHALLENGE_ISSUED -> AUTHENTICATED | REJECTED.
 * Authenticators that need no challenge go straight from INIT to a
 * terminal state. A challenge is issued once and consumed by the first
 * authenticate() call, whatever its outcome.
 */

#include "rdx_secure_memory.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rdx {

enum class AuthState {
    INIT,
    CHALLENGE_ISSUED,
    AUTHENTICATED,
    REJECTED
};

const char* auth_state_to_string(AuthState state);

struct AuthChallenge {
    std::string salt;
    std::string digest;
    std::chrono::steady_clock::time_point issued_at;
};

// ===== Base =====

class Authenticator {
public:
    explicit Authenticator(std::string username);
    virtual ~Authenticator() = default;

    Authenticator(const Authenticator&) = delete;
    Authenticator& operator=(const Authenticator&) = delete;

    virtual std::string name() const = 0;
    virtual bool requires_challenge() const { return true; }

    /**
     * @brief Issue the challenge for this connection
     * @param requested digests offered by the client
     * @return nullopt when no offered digest is acceptable (the
     *         authenticator is then REJECTED) or a challenge was already sent
     */
    virtual std::optional<AuthChallenge> get_challenge(const std::vector<std::string>& requested);

    /// Verify the client's response to the outstanding challenge
    virtual bool authenticate(const std::string& response, const std::string& client_salt);

    virtual AuthState state() const { return state_; }

    const std::string& username() const { return username_; }

protected:
    /// Digests this authenticator can verify, strongest first
    virtual std::vector<std::string> accepted_digests() const;

    virtual bool verify(const std::string& response, const std::string& salt,
                        const std::string& digest) = 0;

    std::string username_;
    AuthState state_ = AuthState::INIT;
    std::optional<AuthChallenge> challenge_;
};

// ===== Variants =====

/// No challenge, accepts everyone
class NoneAuthenticator : public Authenticator {
public:
    using Authenticator::Authenticator;

    std::string name() const override { return "none"; }
    bool requires_challenge() const override { return false; }
    std::optional<AuthChallenge> get_challenge(const std::vector<std::string>& requested) override;
    bool authenticate(const std::string& response, const std::string& client_salt) override;

protected:
    bool verify(const std::string&, const std::string&, const std::string&) override { return true; }
};

/// Issues a challenge, accepts any response
class AllowAuthenticator : public Authenticator {
public:
    using Authenticator::Authenticator;

    std::string name() const override { return "allow"; }
    bool authenticate(const std::string& response, const std::string& client_salt) override;

protected:
    bool verify(const std::string&, const std::string&, const std::string&) override { return true; }
};

/// Issues a challenge, never accepts
class RejectAuthenticator : public Authenticator {
public:
    using Authenticator::Authenticator;

    std::string name() const override { return "reject"; }
    bool authenticate(const std::string& response, const std::string& client_salt) override;

protected:
    bool verify(const std::string&, const std::string&, const std::string&) override { return false; }
};

/// Shared secret verified with an HMAC digest
class PasswordAuthenticator : public Authenticator {
public:
    PasswordAuthenticator(std::string username, SecureString password);

    std::string name() const override { return "password"; }

protected:
    std::vector<std::string> accepted_digests() const override;
    bool verify(const std::string& response, const std::string& salt,
                const std::string& digest) override;

private:
    SecureString password_;
};

/// Decides whether a username / password pair is valid
class IdentityCheck {
public:
    virtual ~IdentityCheck() = default;
    virtual bool check(const std::string& username, const std::string& password) = 0;
};

class CallbackIdentityCheck : public IdentityCheck {
public:
    using Callback = std::function<bool(const std::string&, const std::string&)>;

    explicit CallbackIdentityCheck(Callback cb) : cb_(std::move(cb)) {}
    bool check(const std::string& username, const std::string& password) override {
        return cb_ && cb_(username, password);
    }

private:
    Callback cb_;
};

/**
 * @brief Delegates to an external identity check
 *
 * The plaintext password is recovered from an xor response, so only the
 * "xor" digest is usable; any other digest set rejects the session.
 */
class SystemAuthenticator : public Authenticator {
public:
    SystemAuthenticator(std::string username, std::shared_ptr<IdentityCheck> check);

    std::string name() const override { return "sys"; }
    std::optional<AuthChallenge> get_challenge(const std::vector<std::string>& requested) override;

protected:
    std::vector<std::string> accepted_digests() const override;
    bool verify(const std::string& response, const std::string& salt,
                const std::string& digest) override;

private:
    std::shared_ptr<IdentityCheck> check_;
};

// ===== Chain =====

/**
 * @brief Every member must pass, in order; the first failure rejects
 *
 * The chain exposes its current member's challenge. authenticate()
 * evaluates that member, then evaluates the following members that need
 * no challenge. It returns true only once all members have passed;
 * state() is INIT while another challenge round is needed.
 */
class AuthenticatorChain : public Authenticator {
public:
    AuthenticatorChain(std::string username,
                       std::vector<std::unique_ptr<Authenticator>> members);

    std::string name() const override;
    bool requires_challenge() const override;
    std::optional<AuthChallenge> get_challenge(const std::vector<std::string>& requested) override;
    bool authenticate(const std::string& response, const std::string& client_salt) override;

    size_t size() const { return members_.size(); }
    size_t current() const { return current_; }
    Authenticator* member(size_t i) const { return members_.at(i).get(); }

protected:
    bool verify(const std::string&, const std::string&, const std::string&) override { return false; }

private:
    /// Runs members needing no challenge; false if one of them fails
    bool settle();

    std::vector<std::unique_ptr<Authenticator>> members_;
    size_t current_ = 0;
};

// ===== Factory =====

struct AuthOptions {
    std::string password;
    std::shared_ptr<IdentityCheck> identity_check;
};

class AuthFactory {
public:
    /**
     * @brief Build an authenticator from a mode string
     * @param mode "none", "allow", "reject", "password", "sys", or a comma
     *             separated list of those for a chain
     * @throws std::invalid_argument for unknown modes or missing options
     */
    static std::unique_ptr<Authenticator> create(const std::string& mode,
                                                 const std::string& username,
                                                 const AuthOptions& options);

    static std::vector<std::string> available_modes();
};

} // namespace rdx
