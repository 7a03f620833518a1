#include "credentials.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <filesystem>

namespace dombridge {

FileCredentialProvider::FileCredentialProvider(std::string cert_file, std::string key_file)
    : files_{std::move(cert_file), std::move(key_file)} {}

std::optional<TlsCredentials> FileCredentialProvider::credentials() const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(files_.cert_file, ec)) {
        LOG4CPLUS_ERROR(mcp_logger(), "TLS certificate not found: " << files_.cert_file);
        return std::nullopt;
    }
    if (!std::filesystem::is_regular_file(files_.key_file, ec)) {
        LOG4CPLUS_ERROR(mcp_logger(), "TLS private key not found: " << files_.key_file);
        return std::nullopt;
    }
    return files_;
}

} // namespace dombridge
