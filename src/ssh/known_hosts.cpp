#include "known_hosts.hpp"
#include "libssh2_transport.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <openssl/sha.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

std::string canonical_host_id(const std::string& host, int port) {
    if (port == 22) return host;
    return fmt::format("[{}]:{}", host, port);
}

std::string host_key_fingerprint(const std::string& key_blob) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(key_blob.data()), key_blob.size(), digest);
    std::string b64 = base64_encode(std::string(reinterpret_cast<const char*>(digest), sizeof(digest)));
    while (!b64.empty() && b64.back() == '=') b64.pop_back();
    return "SHA256:" + b64;
}

// ── Key type bits ──────────────────────────────────────────────

static int key_type_bits(const std::string& type) {
    if (type == "ssh-rsa") return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    if (type == "ssh-dss") return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    if (type == "ecdsa-sha2-nistp256") return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    if (type == "ecdsa-sha2-nistp384") return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    if (type == "ecdsa-sha2-nistp521") return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    if (type == "ssh-ed25519") return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    return 0;
}

static std::string key_type_name(int typemask) {
    switch (typemask & LIBSSH2_KNOWNHOST_KEY_MASK) {
    case LIBSSH2_KNOWNHOST_KEY_SSHRSA:     return "ssh-rsa";
    case LIBSSH2_KNOWNHOST_KEY_SSHDSS:     return "ssh-dss";
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_KNOWNHOST_KEY_ECDSA_256:  return "ecdsa-sha2-nistp256";
    case LIBSSH2_KNOWNHOST_KEY_ECDSA_384:  return "ecdsa-sha2-nistp384";
    case LIBSSH2_KNOWNHOST_KEY_ECDSA_521:  return "ecdsa-sha2-nistp521";
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_KNOWNHOST_KEY_ED25519:    return "ssh-ed25519";
#endif
    default:                               return "unknown";
    }
}

// ── KnownHostsFile ─────────────────────────────────────────────

KnownHostsFile::KnownHostsFile(std::string path) : path_(std::move(path)) {
    if (!init_libssh2()) return;
    session_ = libssh2_session_init();
    if (session_) hosts_ = libssh2_knownhost_init(session_);
}

KnownHostsFile::~KnownHostsFile() {
    if (hosts_) libssh2_knownhost_free(hosts_);
    if (session_) libssh2_session_free(session_);
}

std::string KnownHostsFile::last_error() const {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : "unknown libssh2 error";
}

Result<void> KnownHostsFile::load() {
    if (!hosts_) return Result<void>::Err("libssh2 known hosts support unavailable");

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        sshc_log(fmt::format("known_hosts {} does not exist, starting empty", path_));
        return Result<void>::Ok();
    }

    int n = libssh2_knownhost_readfile(hosts_, path_.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (n < 0) {
        return Result<void>::Err(fmt::format("cannot read {}: {}", path_, last_error()));
    }
    sshc_log(fmt::format("known_hosts {}: {} entries", path_, n));
    return Result<void>::Ok();
}

Result<HostKeyCheck> KnownHostsFile::check(const std::string& host_id, const HostKey& key) const {
    if (!hosts_) return Result<HostKeyCheck>::Err("libssh2 known hosts support unavailable");

    // Key type bits left clear: every entry for the host is compared by key
    struct libssh2_knownhost* found = nullptr;
    int rc = libssh2_knownhost_checkp(hosts_, host_id.c_str(), -1,
                                      key.blob.data(), key.blob.size(),
                                      LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW,
                                      &found);
    switch (rc) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:    return Result<HostKeyCheck>::Ok(HostKeyCheck::Match);
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH: return Result<HostKeyCheck>::Ok(HostKeyCheck::Mismatch);
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND: return Result<HostKeyCheck>::Ok(HostKeyCheck::NotFound);
    default:
        return Result<HostKeyCheck>::Err(fmt::format("known hosts check failed: {}", last_error()));
    }
}

Result<void> KnownHostsFile::add(const std::string& host_id, const HostKey& key) {
    if (!hosts_) return Result<void>::Err("libssh2 known hosts support unavailable");

    int type_bits = key_type_bits(key.type);
    if (type_bits == 0) {
        return Result<void>::Err(fmt::format("cannot store a {} host key", key.type));
    }

    struct libssh2_knownhost* stored = nullptr;
    int rc = libssh2_knownhost_addc(hosts_, host_id.c_str(), nullptr,
                                    key.blob.data(), key.blob.size(),
                                    nullptr, 0,
                                    LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | type_bits,
                                    &stored);
    if (rc != 0 || !stored) {
        return Result<void>::Err(fmt::format("cannot add host key for {}: {}", host_id, last_error()));
    }
    pending_.push_back(stored);
    return Result<void>::Ok();
}

Result<void> KnownHostsFile::save() {
    if (pending_.empty()) return Result<void>::Ok();

    std::string text;
    std::vector<char> buf(4096);
    for (auto* entry : pending_) {
        size_t len = 0;
        int rc;
        while ((rc = libssh2_knownhost_writeline(hosts_, entry, buf.data(), buf.size(), &len,
                                                 LIBSSH2_KNOWNHOST_FILE_OPENSSH)) ==
               LIBSSH2_ERROR_BUFFER_TOO_SMALL) {
            buf.resize(buf.size() * 2);
        }
        if (rc != 0) {
            return Result<void>::Err(fmt::format("cannot format known_hosts entry: {}", last_error()));
        }
        text.append(buf.data(), len);
    }

    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path() && !fs::exists(target.parent_path(), ec)) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(fmt::format("cannot create {}: {}",
                                                 target.parent_path().string(), ec.message()));
        }
        fs::permissions(target.parent_path(), fs::perms::owner_all, fs::perm_options::replace, ec);
    }

    // Start on a fresh line when the file lacks a trailing newline
    bool need_newline = false;
    if (fs::exists(target, ec) && fs::file_size(target, ec) > 0 && !ec) {
        std::ifstream in(target, std::ios::binary);
        in.seekg(-1, std::ios::end);
        char last = '\n';
        in.get(last);
        need_newline = last != '\n';
    }

    std::ofstream out(target, std::ios::app | std::ios::binary);
    if (!out) return Result<void>::Err("cannot open " + path_ + " for writing");
    if (need_newline) out << '\n';
    out << text;
    out.flush();
    if (!out) return Result<void>::Err("write failed for " + path_);

    pending_.clear();
    return Result<void>::Ok();
}

std::vector<KnownHostEntry> KnownHostsFile::entries() const {
    std::vector<KnownHostEntry> out;
    if (!hosts_) return out;

    struct libssh2_knownhost* prev = nullptr;
    struct libssh2_knownhost* cur = nullptr;
    while (libssh2_knownhost_get(hosts_, &cur, prev) == 0) {
        out.push_back(KnownHostEntry{cur->name ? cur->name : "",
                                     key_type_name(cur->typemask),
                                     cur->key ? cur->key : ""});
        prev = cur;
    }
    return out;
}
