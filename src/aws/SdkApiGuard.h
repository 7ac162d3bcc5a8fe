#pragma once
#include <aws/core/Aws.h>

namespace cloud_audit {
namespace aws {

// Aws::InitAPI for the lifetime of the object. Exactly one per process.
class SdkApiGuard {
public:
    SdkApiGuard() { Aws::InitAPI(options_); }
    ~SdkApiGuard() { Aws::ShutdownAPI(options_); }
    SdkApiGuard(const SdkApiGuard&) = delete;
    SdkApiGuard& operator=(const SdkApiGuard&) = delete;
private:
    Aws::SDKOptions options_;
};

}
}
