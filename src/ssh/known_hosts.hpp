#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_KNOWNHOSTS LIBSSH2_KNOWNHOSTS;
struct libssh2_knownhost;

// One entry as libssh2 holds it. name is empty for hashed entries.
struct KnownHostEntry {
    std::string name;
    std::string key_type;
    std::string key_base64;
};

enum class HostKeyCheck { Match, NotFound, Mismatch };

// "host" for port 22, "[host]:port" otherwise.
std::string canonical_host_id(const std::string& host, int port);

// "SHA256:" + unpadded base64 of the SHA-256 digest of the key blob,
// the form OpenSSH prints.
std::string host_key_fingerprint(const std::string& key_blob);

// OpenSSH known_hosts file backed by libssh2's knownhost collection.
// The collection lives on its own unconnected libssh2 session, so it can
// be read and checked before (or without) a transport.
class KnownHostsFile {
public:
    explicit KnownHostsFile(std::string path);
    ~KnownHostsFile();

    KnownHostsFile(const KnownHostsFile&) = delete;
    KnownHostsFile& operator=(const KnownHostsFile&) = delete;

    // Read the file. A missing file is an empty database.
    Result<void> load();

    // host_id is matched exactly (see canonical_host_id), plain or hashed.
    // Key types are not compared: a host pinned to a key of another type
    // is a Mismatch.
    Result<HostKeyCheck> check(const std::string& host_id, const HostKey& key) const;

    Result<void> add(const std::string& host_id, const HostKey& key);

    // Append the entries added since load(). Existing content, including
    // comments and lines libssh2 does not understand, is never rewritten.
    // Creates the parent directory (mode 0700) if needed.
    Result<void> save();

    std::vector<KnownHostEntry> entries() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_KNOWNHOSTS* hosts_ = nullptr;
    std::vector<libssh2_knownhost*> pending_;

    std::string last_error() const;
};
