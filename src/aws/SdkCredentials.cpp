#include "SdkCredentials.h"
#include "../core/Errors.h"
#include "../core/Logging.h"

namespace cloud_audit {
namespace aws {

Aws::Auth::AWSCredentials to_sdk(const Credentials& c) {
    Aws::Auth::AWSCredentials out(c.access_key_id, c.secret_access_key, c.session_token);
    out.SetExpiration(Aws::Utils::DateTime(c.expiration));
    return out;
}

Credentials from_sdk(const Aws::Auth::AWSCredentials& c) {
    Credentials out;
    out.access_key_id = c.GetAWSAccessKeyId();
    out.secret_access_key = c.GetAWSSecretKey();
    out.session_token = c.GetSessionToken();
    out.expiration = c.GetExpiration().UnderlyingTimestamp();
    return out;
}

Aws::Auth::AWSCredentials SdkCredentialsProvider::GetAWSCredentials() {
    try {
        return to_sdk(provider_->current_valid());
    } catch(const RefreshError& ex) {
        Logger::instance().error(std::string("RefreshError -- ") + ex.what());
        return Aws::Auth::AWSCredentials();
    }
}

}
}
