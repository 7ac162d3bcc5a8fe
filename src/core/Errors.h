#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace cloud_audit {

// Setup-time authentication failure. Never retried: the caller is expected to abort.
class AuthError : public std::runtime_error {
public:
    enum class Kind { NoUsableIdentity, AssumeRoleFailed };
    AuthError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
    Kind kind() const { return kind_; }
private:
    Kind kind_;
};

// Raised from CredentialProvider::current_valid() when a refresh exchange fails.
class RefreshError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A listing call for one region/operation failed.
class CollectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MalformedIdentifier : public std::invalid_argument {
public:
    explicit MalformedIdentifier(const std::string& identifier)
        : std::invalid_argument("malformed resource identifier: " + identifier), identifier_(identifier) {}
    const std::string& identifier() const { return identifier_; }
private:
    std::string identifier_;
};

class CheckNotFound : public std::out_of_range {
public:
    explicit CheckNotFound(const std::string& service)
        : std::out_of_range("no checks registered for service: " + service) {}
};

class CatalogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Error returned by a provider API call; code is the provider's error class (e.g. "ThrottlingException").
class ProviderError : public std::runtime_error {
public:
    ProviderError(std::string code, const std::string& msg) : std::runtime_error(msg), code_(std::move(code)) {}
    const std::string& code() const { return code_; }
private:
    std::string code_;
};

// Best-effort error class name for log lines ("<region> -- <class>: <message>").
inline std::string error_class(const std::exception& ex) {
    if(auto* p = dynamic_cast<const ProviderError*>(&ex)) return p->code();
    if(dynamic_cast<const RefreshError*>(&ex)) return "RefreshError";
    if(dynamic_cast<const CollectionError*>(&ex)) return "CollectionError";
    if(dynamic_cast<const AuthError*>(&ex)) return "AuthError";
    return "Exception";
}

}
