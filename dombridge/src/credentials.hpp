#pragma once

#include <optional>
#include <string>

namespace dombridge {

/// Certificate chain and private key, both PEM files on disk.
struct TlsCredentials {
    std::string cert_file;
    std::string key_file;
};

/// Source of ready-made TLS credentials for the HTTP transport.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    virtual std::optional<TlsCredentials> credentials() const = 0;
};

/// Credentials provisioned out of band and passed on the command line.
class FileCredentialProvider final : public CredentialProvider {
public:
    FileCredentialProvider(std::string cert_file, std::string key_file);

    std::optional<TlsCredentials> credentials() const override;

private:
    TlsCredentials files_;
};

} // namespace dombridge
