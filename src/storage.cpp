#include "kioskagent/storage.hpp"
#include "kioskagent/json.hpp"

#include <boost/log/trivial.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

namespace kioskagent {

namespace {

constexpr const char* CREDENTIALS_FILE = "registration.json";
constexpr const char* BRANCH_INFO_FILE = "branchInfo.json";

}  // namespace

// ==================== File Helpers ====================

namespace files {

bool write_file_atomic(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            BOOST_LOG_TRIVIAL(error) << "Cannot create " << path.parent_path() << ": " << ec.message();
            return false;
        }
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            BOOST_LOG_TRIVIAL(error) << "Cannot open " << tmp << " for writing";
            return false;
        }
        file << content;
        file.flush();
        if (!file) {
            BOOST_LOG_TRIVIAL(error) << "Write to " << tmp << " failed";
            file.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        BOOST_LOG_TRIVIAL(error) << "Cannot rename " << tmp << " to " << path << ": " << ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        BOOST_LOG_TRIVIAL(warning) << "Cannot open " << path << " for reading";
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return content;
}

bool remove_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        BOOST_LOG_TRIVIAL(error) << "Cannot remove " << path << ": " << ec.message();
        return false;
    }
    return true;
}

}  // namespace files

// ==================== FileCredentialStore Implementation ====================

FileCredentialStore::FileCredentialStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path FileCredentialStore::credentials_path() const {
    return directory_ / CREDENTIALS_FILE;
}

std::filesystem::path FileCredentialStore::branch_info_path() const {
    return directory_ / BRANCH_INFO_FILE;
}

bool FileCredentialStore::set_credentials(const DeviceCredentials& credentials) {
    std::lock_guard<std::mutex> lock(mutex_);
    return files::write_file_atomic(credentials_path(), json::credentials_to_json(credentials).dump(2));
}

std::optional<DeviceCredentials> FileCredentialStore::get_credentials() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = files::read_file(credentials_path());
    if (!content) {
        return std::nullopt;
    }

    auto j = json::try_parse(*content);
    if (!j) {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring malformed " << credentials_path();
        return std::nullopt;
    }

    auto parsed = json::parse_credentials(*j);
    if (parsed.is_error()) {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring " << credentials_path() << ": " << parsed.error_message();
        return std::nullopt;
    }
    return std::move(parsed).value();
}

bool FileCredentialStore::clear_credentials() {
    std::lock_guard<std::mutex> lock(mutex_);
    return files::remove_file(credentials_path());
}

bool FileCredentialStore::set_branch_info(const BranchInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    return files::write_file_atomic(branch_info_path(), json::branch_info_to_json(info).dump(2));
}

std::optional<BranchInfo> FileCredentialStore::get_branch_info() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto content = files::read_file(branch_info_path());
    if (!content) {
        return std::nullopt;
    }

    auto j = json::try_parse(*content);
    if (!j) {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring malformed " << branch_info_path();
        return std::nullopt;
    }

    auto parsed = json::parse_branch_info(*j);
    if (parsed.is_error()) {
        return std::nullopt;
    }
    return std::move(parsed).value();
}

bool FileCredentialStore::clear_branch_info() {
    std::lock_guard<std::mutex> lock(mutex_);
    return files::remove_file(branch_info_path());
}

bool FileCredentialStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool credentials_removed = files::remove_file(credentials_path());
    bool branch_removed = files::remove_file(branch_info_path());
    return credentials_removed && branch_removed;
}

// ==================== MemoryCredentialStore Implementation ====================

bool MemoryCredentialStore::set_credentials(const DeviceCredentials& credentials) {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_ = credentials;
    return true;
}

std::optional<DeviceCredentials> MemoryCredentialStore::get_credentials() {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_;
}

bool MemoryCredentialStore::clear_credentials() {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_.reset();
    return true;
}

bool MemoryCredentialStore::set_branch_info(const BranchInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    branch_info_ = info;
    return true;
}

std::optional<BranchInfo> MemoryCredentialStore::get_branch_info() {
    std::lock_guard<std::mutex> lock(mutex_);
    return branch_info_;
}

bool MemoryCredentialStore::clear_branch_info() {
    std::lock_guard<std::mutex> lock(mutex_);
    branch_info_.reset();
    return true;
}

bool MemoryCredentialStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_.reset();
    branch_info_.reset();
    return true;
}

}  // namespace kioskagent
