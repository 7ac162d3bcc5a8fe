#include "AwsIdentityResolver.h"
#include "SdkCredentials.h"
#include "../core/Logging.h"
#include <aws/core/auth/AWSCredentialsProviderChain.h>

namespace cloud_audit {
namespace aws {

std::optional<Credentials> AwsIdentityResolver::resolve(const std::string& profile) {
    Aws::Auth::AWSCredentials creds;
    if(profile.empty()) {
        Aws::Auth::DefaultAWSCredentialsProviderChain chain;
        creds = chain.GetAWSCredentials();
    } else {
        Aws::Auth::ProfileConfigFileAWSCredentialsProvider provider(profile.c_str());
        creds = provider.GetAWSCredentials();
    }
    if(creds.IsEmpty()) return std::nullopt;
    Logger::instance().debug("Resolved credentials for " + (profile.empty() ? std::string("default chain") : "profile " + profile));
    return from_sdk(creds);
}

}
}
