#include "secret_source.hpp"
#include "log.hpp"
#include <platform/process.hpp>
#include <fmt/format.h>

AwsSsmSecretSource::AwsSsmSecretSource(const SecretRef& ref) : ref_(ref) {}

std::vector<std::string> AwsSsmSecretSource::cli_args(const std::string& path) const {
    return {
        "ssm", "get-parameter",
        "--name", path,
        "--with-decryption",
        "--region", ref_.region,
        "--query", "Parameter.Value",
        "--output", "text",
    };
}

Result<std::string> AwsSsmSecretSource::fetch(const std::string& path) {
    sshc_log(fmt::format("Fetching SSH key from SSM: {} ({})", path, ref_.region));

    std::vector<std::pair<std::string, std::string>> env;
    if (ref_.access_key_id && ref_.secret_access_key) {
        env.emplace_back("AWS_ACCESS_KEY_ID", *ref_.access_key_id);
        env.emplace_back("AWS_SECRET_ACCESS_KEY", *ref_.secret_access_key);
    }
    // Otherwise the CLI falls back to its own chain (env, profile, instance role)

    auto result = platform::run_capture("aws", cli_args(path), env);
    if (result.is_err()) {
        return Result<std::string>::Err(
            fmt::format("failed to fetch SSM parameter '{}': {}", path, result.error));
    }

    std::string key = std::move(result.value);
    // `--output text` appends one newline to the value
    if (!key.empty() && key.back() == '\n') key.pop_back();
    if (key.empty()) {
        return Result<std::string>::Err(fmt::format("SSM parameter '{}' is empty", path));
    }
    key += '\n';

    sshc_log("SSM key fetched (never written to disk)");
    return Result<std::string>::Ok(std::move(key));
}
