#pragma once

/**
 * @file storage.hpp
 * @brief Durable credential storage for the kiosk agent
 *
 * Holds the device identity (registration.json) and the branch record
 * (branchInfo.json). Every write goes through a temporary file that is
 * renamed over the target, so a crash never leaves a half-written document.
 */

#include "kioskagent/kioskagent.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace kioskagent {

/**
 * @brief Storage interface for device credentials and branch details
 *
 * Implementations are safe for concurrent use.
 */
class CredentialStoreInterface {
  public:
    virtual ~CredentialStoreInterface() = default;

    /// Store credentials, replacing any previous record
    virtual bool set_credentials(const DeviceCredentials& credentials) = 0;

    /// Retrieve stored credentials
    virtual std::optional<DeviceCredentials> get_credentials() = 0;

    /// Delete stored credentials; false if the record could not be removed
    virtual bool clear_credentials() = 0;

    /// Store branch details
    virtual bool set_branch_info(const BranchInfo& info) = 0;

    /// Retrieve branch details
    virtual std::optional<BranchInfo> get_branch_info() = 0;

    /// Delete branch details
    virtual bool clear_branch_info() = 0;

    /// Delete everything
    virtual bool clear_all() = 0;
};

/**
 * @brief File-based credential store
 *
 * Writes registration.json and branchInfo.json in the configured directory.
 */
class FileCredentialStore : public CredentialStoreInterface {
  public:
    /**
     * @brief Construct file storage
     *
     * @param directory Directory holding the credential files; created on first write
     */
    explicit FileCredentialStore(std::filesystem::path directory);

    bool set_credentials(const DeviceCredentials& credentials) override;
    std::optional<DeviceCredentials> get_credentials() override;
    bool clear_credentials() override;

    bool set_branch_info(const BranchInfo& info) override;
    std::optional<BranchInfo> get_branch_info() override;
    bool clear_branch_info() override;

    bool clear_all() override;

    [[nodiscard]] std::filesystem::path credentials_path() const;
    [[nodiscard]] std::filesystem::path branch_info_path() const;

  private:
    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

/**
 * @brief In-memory credential store (for testing or no persistence)
 */
class MemoryCredentialStore : public CredentialStoreInterface {
  public:
    bool set_credentials(const DeviceCredentials& credentials) override;
    std::optional<DeviceCredentials> get_credentials() override;
    bool clear_credentials() override;

    bool set_branch_info(const BranchInfo& info) override;
    std::optional<BranchInfo> get_branch_info() override;
    bool clear_branch_info() override;

    bool clear_all() override;

  private:
    std::optional<DeviceCredentials> credentials_;
    std::optional<BranchInfo> branch_info_;
    mutable std::mutex mutex_;
};

namespace files {

/// Write content to path via "<path>.tmp" and rename; creates parent directories
bool write_file_atomic(const std::filesystem::path& path, const std::string& content);

/// Read a whole file; nullopt if it does not exist or cannot be read
std::optional<std::string> read_file(const std::filesystem::path& path);

/// Remove a file if present; false only when removal failed
bool remove_file(const std::filesystem::path& path);

}  // namespace files

}  // namespace kioskagent
