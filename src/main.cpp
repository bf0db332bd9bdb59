#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>
#include <fmt/format.h>
#include "cli/options.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "core/secret_source.hpp"
#include "platform/platform.hpp"
#include "managers/connection_supervisor.hpp"
#include "ssh/libssh2_transport.hpp"
#include "ssh/trust_store.hpp"

int main(int argc, char** argv) {
    // Closed tunnel peers must surface as write errors
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto parsed = parse_options(std::vector<std::string>(argv + 1, argv + argc));
        if (parsed.is_err()) {
            sshc_error(parsed.error);
            std::fputs("Usage: sshc [options] [user@]host [command]\n", stderr);
            return 1;
        }
        const CliOptions& opts = parsed.value;

        if (opts.show_help) {
            std::fputs(usage_text().c_str(), stdout);
            return 0;
        }
        if (opts.show_version) {
            std::printf("sshc %s\n", SSHC_VERSION);
            return 0;
        }

        set_debug_logging(opts.overrides.debug);
        for (const auto& w : opts.warnings) sshc_warn(w);

        auto config = load_config(opts.overrides, Environment::from_process());
        if (config.is_err()) {
            sshc_error(config.error);
            return 1;
        }
        const ResolvedConfig& cfg = config.value;
        sshc_log(fmt::format("sshc {} -> {}@{}:{}", SSHC_VERSION, cfg.user, cfg.host, cfg.port));

        // The key is fetched before any network activity and only kept in memory
        std::optional<std::string> key_data;
        if (cfg.secret) {
            AwsSsmSecretSource source(*cfg.secret);
            auto key = source.fetch(cfg.secret->path);
            if (key.is_err()) {
                sshc_error(key.error);
                return 1;
            }
            key_data = std::move(key.value);
        }

        std::unique_ptr<TrustStore> trust;
        if (cfg.verify_host_key) {
            trust = std::make_unique<TrustStore>(cfg.known_hosts, platform::is_tty(STDIN_FILENO));
        } else {
            sshc_warn("host key verification disabled (--no-known-hosts); this connection is insecure.");
        }

        Libssh2Connector connector;
        ConnectionSupervisor supervisor(cfg, connector, trust.get(), std::move(key_data));
        return supervisor.run();

    } catch (const std::exception& e) {
        sshc_error(e.what());
        return 1;
    }
}
