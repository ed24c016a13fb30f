#include "auth.h"

namespace cloudless {

StaticTokenVerifier::StaticTokenVerifier(const std::unordered_map<std::string, std::string>& tokens)
    : tokens_(tokens) {
}

bool StaticTokenVerifier::verify(const std::string& credential, std::string& subject) {
    if (credential.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(tokens_mutex_);
    auto it = tokens_.find(credential);
    if (it == tokens_.end() || it->second.empty()) {
        return false;
    }
    subject = it->second;
    return true;
}

void StaticTokenVerifier::add_token(const std::string& token, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    tokens_[token] = user_id;
}

bool StaticTokenVerifier::revoke_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    return tokens_.erase(token) > 0;
}

size_t StaticTokenVerifier::get_token_count() const {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    return tokens_.size();
}

} // namespace cloudless
