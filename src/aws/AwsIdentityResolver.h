#pragma once
#include "../core/Provider.h"

namespace cloud_audit {
namespace aws {

// Named profile from the shared config/credentials files, or the SDK default chain.
class AwsIdentityResolver : public IdentityResolver {
public:
    std::optional<Credentials> resolve(const std::string& profile) override;
};

}
}
