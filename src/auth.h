#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace cloudless {

/**
 * Validates a bearer credential and yields the subject (user id) it was issued to.
 */
class AuthVerifier {
public:
    virtual ~AuthVerifier() = default;

    /**
     * @param credential Bearer token presented by the client
     * @param subject Receives the user id on success
     * @return true if the credential is valid
     */
    virtual bool verify(const std::string& credential, std::string& subject) = 0;
};

/**
 * Fixed token -> user id table, populated from the server configuration.
 */
class StaticTokenVerifier : public AuthVerifier {
public:
    StaticTokenVerifier() = default;
    explicit StaticTokenVerifier(const std::unordered_map<std::string, std::string>& tokens);

    bool verify(const std::string& credential, std::string& subject) override;

    void add_token(const std::string& token, const std::string& user_id);
    bool revoke_token(const std::string& token);
    size_t get_token_count() const;

private:
    mutable std::mutex tokens_mutex_;
    std::unordered_map<std::string, std::string> tokens_;
};

} // namespace cloudless
