#pragma once
#include "../core/Provider.h"

namespace cloud_audit {
namespace aws {

class AwsStsClient : public StsApi {
public:
    Credentials assume_role(const Credentials& caller, const std::string& region, const AssumeRoleRequest& request) override;
};

}
}
