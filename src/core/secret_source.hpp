#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Fetches a private key blob by identifier. The returned string lives only
// in memory; implementations must never write it to disk.
class SecretSource {
public:
    virtual ~SecretSource() = default;
    virtual Result<std::string> fetch(const std::string& path) = 0;
};

// AWS SSM Parameter Store via the aws CLI. The parameter value is read
// from the child's stdout pipe. Explicit access keys are handed to the
// child through its environment only.
class AwsSsmSecretSource : public SecretSource {
public:
    explicit AwsSsmSecretSource(const SecretRef& ref);

    Result<std::string> fetch(const std::string& path) override;

    // Arguments passed to `aws` (exposed for tests).
    std::vector<std::string> cli_args(const std::string& path) const;

private:
    SecretRef ref_;
};
