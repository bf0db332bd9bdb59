#include "options.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <optional>

static Result<int> parse_port_arg(const std::string& v) {
    int port = parse_port(v);
    if (port == 0) return Result<int>::Err(fmt::format("invalid port '{}'", v));
    return Result<int>::Ok(port);
}

static Result<int> parse_count(const std::string& key, const std::string& v) {
    std::string s = v;
    trim(s);
    bool digits = !s.empty() && std::all_of(s.begin(), s.end(),
                                            [](unsigned char c) { return std::isdigit(c) != 0; });
    // Out of int range reads as -1
    int n = digits ? safe_stoi(s, -1) : -1;
    if (n < 0) return Result<int>::Err(fmt::format("invalid value for {}: '{}'", key, v));
    return Result<int>::Ok(n);
}

static Result<bool> parse_yes_no(const std::string& key, const std::string& v) {
    std::string s = to_lower(v);
    trim(s);
    if (s == "yes" || s == "true") return Result<bool>::Ok(true);
    if (s == "no" || s == "false") return Result<bool>::Ok(false);
    return Result<bool>::Err(fmt::format("invalid value for {}: '{}'", key, v));
}

Result<bool> apply_ssh_option(const std::string& option, ConfigOverrides& out) {
    std::string key, value;
    auto eq = option.find('=');
    if (eq != std::string::npos) {
        key = option.substr(0, eq);
        value = option.substr(eq + 1);
    } else {
        auto parts = split_whitespace(option);
        if (!parts.empty()) key = parts[0];
        if (parts.size() > 1) value = option.substr(option.find(parts[1]));
    }
    trim(key);
    trim(value);
    std::string lkey = to_lower(key);

    if (lkey == "connecttimeout") {
        auto n = parse_count(key, value);
        if (n.is_err()) return Result<bool>::Err(n.error);
        out.connect_timeout = n.value;
    } else if (lkey == "connectionattempts") {
        auto n = parse_count(key, value);
        if (n.is_err()) return Result<bool>::Err(n.error);
        out.connection_attempts = (std::max)(n.value, 1);
    } else if (lkey == "serveraliveinterval") {
        auto n = parse_count(key, value);
        if (n.is_err()) return Result<bool>::Err(n.error);
        out.server_alive_interval = n.value;
    } else if (lkey == "identitiesonly") {
        auto b = parse_yes_no(key, value);
        if (b.is_err()) return Result<bool>::Err(b.error);
        out.identities_only = b.value;
    } else if (lkey == "userknownhostsfile") {
        if (value.empty()) return Result<bool>::Err("UserKnownHostsFile needs a path");
        out.known_hosts = value;
    } else if (lkey == "port") {
        auto p = parse_port_arg(value);
        if (p.is_err()) return Result<bool>::Err(p.error);
        out.port = p.value;
    } else if (lkey == "user") {
        out.user = value;
    } else {
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Ok(true);
}

// ── Option table ──────────────────────────────────────────────

enum class Opt {
    Port, Login, Option, Identity, Forward, SsmPath, AwsRegion, AwsKeyId, AwsSecret,
    NoAgent, NoKnownHosts, Debug, Version, Help,
};

struct OptDef {
    const char* short_name;   // "-p" or nullptr
    const char* long_name;    // "--port" or nullptr
    Opt id;
    bool takes_value;
};

static const OptDef OPTIONS[] = {
    {"-p", "--port",                  Opt::Port,         true},
    {"-l", "--login",                 Opt::Login,        true},
    {"-o", nullptr,                   Opt::Option,       true},
    {"-i", "--identity",              Opt::Identity,     true},
    {"-L", nullptr,                   Opt::Forward,      true},
    {nullptr, "--ssm-secret-path",    Opt::SsmPath,      true},
    {nullptr, "--aws-region",         Opt::AwsRegion,    true},
    {nullptr, "--aws-access-key-id",  Opt::AwsKeyId,     true},
    {nullptr, "--aws-secret-access-key", Opt::AwsSecret, true},
    {"-A", "--no-agent",              Opt::NoAgent,      false},
    {nullptr, "--no-known-hosts",     Opt::NoKnownHosts, false},
    {"-d", "--debug",                 Opt::Debug,        false},
    {"-V", "--version",               Opt::Version,      false},
    {"-h", "--help",                  Opt::Help,         false},
};

static Result<void> apply(Opt id, const std::string& value, CliOptions& opts) {
    auto& o = opts.overrides;
    switch (id) {
    case Opt::Port: {
        auto p = parse_port_arg(value);
        if (p.is_err()) return Result<void>::Err(p.error);
        o.port = p.value;
        break;
    }
    case Opt::Login:        o.user = value; break;
    case Opt::Identity:     o.identity = value; break;
    case Opt::Forward:      o.forwards.push_back(value); break;
    case Opt::SsmPath:      o.ssm_secret_path = value; break;
    case Opt::AwsRegion:    o.aws_region = value; break;
    case Opt::AwsKeyId:     o.aws_access_key_id = value; break;
    case Opt::AwsSecret:    o.aws_secret_access_key = value; break;
    case Opt::NoAgent:      o.no_agent = true; break;
    case Opt::NoKnownHosts: o.no_known_hosts = true; break;
    case Opt::Debug:        o.debug = true; break;
    case Opt::Version:      opts.show_version = true; break;
    case Opt::Help:         opts.show_help = true; break;
    case Opt::Option: {
        auto r = apply_ssh_option(value, o);
        if (r.is_err()) return Result<void>::Err(r.error);
        if (!r.value) {
            auto eq = value.find('=');
            std::string key = value.substr(0, eq);
            trim(key);
            opts.warnings.push_back(fmt::format("unsupported option '{}'", key));
        }
        break;
    }
    }
    return Result<void>::Ok();
}

Result<CliOptions> parse_options(const std::vector<std::string>& args) {
    CliOptions opts;
    std::optional<std::string> destination;
    std::vector<std::string> command;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (destination) {
            command.push_back(arg);
            continue;
        }
        if (arg == "--") {
            if (i + 1 < args.size()) destination = args[++i];
            continue;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            destination = arg;
            continue;
        }

        const OptDef* def = nullptr;
        std::optional<std::string> inline_value;
        for (const auto& d : OPTIONS) {
            if (d.long_name && arg.compare(0, 2, "--") == 0) {
                std::string name = arg.substr(0, arg.find('='));
                if (name == d.long_name) {
                    def = &d;
                    if (arg.find('=') != std::string::npos) inline_value = arg.substr(arg.find('=') + 1);
                    break;
                }
            } else if (d.short_name && arg.compare(0, 2, d.short_name) == 0 && arg[1] != '-') {
                def = &d;
                if (arg.size() > 2) inline_value = arg.substr(2);
                break;
            }
        }
        if (!def) return Result<CliOptions>::Err(fmt::format("unknown option '{}'", arg));

        std::string value;
        if (def->takes_value) {
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return Result<CliOptions>::Err(fmt::format("option '{}' requires a value", arg));
            }
        } else if (inline_value) {
            return Result<CliOptions>::Err(fmt::format("option '{}' takes no value", arg));
        }

        auto r = apply(def->id, value, opts);
        if (r.is_err()) return Result<CliOptions>::Err(r.error);
    }

    if (opts.show_help || opts.show_version) return Result<CliOptions>::Ok(opts);

    if (!destination) return Result<CliOptions>::Err("host required.");

    auto& o = opts.overrides;
    if (o.identity && o.ssm_secret_path) {
        return Result<CliOptions>::Err("--identity and --ssm-secret-path are mutually exclusive.");
    }

    auto at = destination->find('@');
    if (at != std::string::npos) {
        o.user = destination->substr(0, at);
        o.host = destination->substr(at + 1);
    } else {
        o.host = *destination;
    }
    if (o.host.empty()) return Result<CliOptions>::Err("host cannot be empty.");

    if (!command.empty()) {
        std::string joined;
        for (size_t i = 0; i < command.size(); i++) {
            if (i) joined += ' ';
            joined += command[i];
        }
        o.command = joined;
    }

    return Result<CliOptions>::Ok(opts);
}

std::string usage_text() {
    std::string out;
    out += theme::bold("sshc") + " " + theme::dim(SSHC_VERSION) + "\n";
    out += theme::section("Usage");
    out += "  sshc [options] [user@]host [command]\n";

    out += theme::section("Connection");
    out += theme::option("-p, --port=PORT", "Port to connect on (default: 22)");
    out += theme::option("-l, --login=USER", "Username to log in as");
    out += theme::option("-L LPORT:HOST:RPORT", "Forward 127.0.0.1:LPORT to HOST:RPORT");
    out += theme::option("-o Key=Value", "ConnectTimeout, ConnectionAttempts,");
    out += theme::option("", "ServerAliveInterval, IdentitiesOnly,");
    out += theme::option("", "UserKnownHostsFile");

    out += theme::section("Authentication");
    out += theme::option("-i, --identity=FILE", "Private key file");
    out += theme::option("-A, --no-agent", "Disable ssh-agent authentication");
    out += theme::option("--ssm-secret-path PATH", "AWS SSM SecureString holding the private key");
    out += theme::option("--aws-region REGION", "AWS region (default: AWS_REGION or us-east-1)");
    out += theme::option("--aws-access-key-id KEY", "Overrides AWS_ACCESS_KEY_ID");
    out += theme::option("--aws-secret-access-key SECRET", "Overrides AWS_SECRET_ACCESS_KEY");

    out += theme::section("Host verification");
    out += theme::option("--no-known-hosts", "Skip known_hosts verification (insecure)");

    out += theme::section("General");
    out += theme::option("-d, --debug", "Echo the debug log to stderr");
    out += theme::option("-V, --version", "Show version and exit");
    out += theme::option("-h, --help", "Show this help");
    return out;
}
