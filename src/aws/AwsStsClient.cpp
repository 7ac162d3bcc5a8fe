#include "AwsStsClient.h"
#include "SdkCredentials.h"
#include "../core/Errors.h"
#include <aws/core/client/ClientConfiguration.h>
#include <aws/sts/STSClient.h>
#include <aws/sts/STSEndpointProvider.h>
#include <aws/sts/model/AssumeRoleRequest.h>

namespace cloud_audit {
namespace aws {

static const char* kAllocationTag = "cloud-audit-sts";

Credentials AwsStsClient::assume_role(const Credentials& caller, const std::string& region, const AssumeRoleRequest& request) {
    Aws::Client::ClientConfiguration config;
    config.region = region;
    auto base = std::make_shared<Aws::Auth::SimpleAWSCredentialsProvider>(to_sdk(caller));
    Aws::STS::STSClient sts(base, Aws::MakeShared<Aws::STS::Endpoint::STSEndpointProvider>(kAllocationTag),
                            Aws::STS::STSClientConfiguration(config));

    Aws::STS::Model::AssumeRoleRequest req;
    req.SetRoleArn(request.role_arn);
    req.SetRoleSessionName(request.role_session_name);
    req.SetDurationSeconds(request.duration_seconds);
    if(request.external_id) req.SetExternalId(*request.external_id);

    auto outcome = sts.AssumeRole(req);
    if(!outcome.IsSuccess()) {
        const auto& err = outcome.GetError();
        throw ProviderError(err.GetExceptionName(), err.GetMessage());
    }
    const auto& c = outcome.GetResult().GetCredentials();
    Credentials out;
    out.access_key_id = c.GetAccessKeyId();
    out.secret_access_key = c.GetSecretAccessKey();
    out.session_token = c.GetSessionToken();
    out.expiration = c.GetExpiration().UnderlyingTimestamp();
    return out;
}

}
}
