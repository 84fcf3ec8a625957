#include "jobs/private_data_dir.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace playrun::jobs {
namespace {

OsError LastOsError(const std::string& context) {
    const int err = errno;
    return OsError(err, std::strerror(err), context);
}

void WriteAll(int fd, const std::string& data, const std::string& path) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        const auto written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const auto error = LastOsError("write " + path);
            ::close(fd);
            throw error;
        }
        offset += static_cast<std::size_t>(written);
    }
}

}  // namespace

PrivateDataDir::PrivateDataDir(std::string path)
    : path_(std::move(path)) {}

PrivateDataDir PrivateDataDir::Open(const std::string& root) {
    std::string pattern = root + "/playrun_XXXXXX";
    if (::mkdtemp(&pattern[0]) == nullptr) {
        throw LastOsError("mkdtemp " + root);
    }
    if (::chmod(pattern.c_str(), 0700) != 0) {
        const auto error = LastOsError("chmod " + pattern);
        ::rmdir(pattern.c_str());
        throw error;
    }
    utils::LogDebug("private_data", "opened " + pattern);
    return PrivateDataDir(pattern);
}

PrivateDataDir::PrivateDataDir(PrivateDataDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

PrivateDataDir& PrivateDataDir::operator=(PrivateDataDir&& other) noexcept {
    if (this != &other) {
        Close();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

PrivateDataDir::~PrivateDataDir() {
    Close();
}

std::string PrivateDataDir::AuthSockPath() const {
    return path_ + "/ssh_auth.sock";
}

std::string PrivateDataDir::WriteSecret(const std::string& name, const std::string& data, mode_t mode) {
    const auto path = path_ + "/" + name;
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        throw LastOsError("open " + path);
    }
    WriteAll(fd, data, path);
    if (::fchmod(fd, mode) != 0) {
        const auto error = LastOsError("fchmod " + path);
        ::close(fd);
        throw error;
    }
    ::close(fd);
    return path;
}

std::string PrivateDataDir::WriteTempSecret(const std::string& prefix, const std::string& data) {
    std::string path = path_ + "/" + prefix + "XXXXXX";
    const int fd = ::mkstemp(&path[0]);
    if (fd < 0) {
        throw LastOsError("mkstemp " + path_);
    }
    WriteAll(fd, data, path);
    if (::fchmod(fd, 0600) != 0) {
        const auto error = LastOsError("fchmod " + path);
        ::close(fd);
        throw error;
    }
    ::close(fd);
    return path;
}

std::string PrivateDataDir::MakeScratchDir(const std::string& prefix) {
    std::string path = path_ + "/" + prefix + "XXXXXX";
    if (::mkdtemp(&path[0]) == nullptr) {
        throw LastOsError("mkdtemp " + path_);
    }
    if (::chmod(path.c_str(), 0700) != 0) {
        throw LastOsError("chmod " + path);
    }
    return path;
}

void PrivateDataDir::Close() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::LogWarn("private_data", "failed to remove " + path_ + ": " + ec.message());
    }
    path_.clear();
}

std::vector<std::string> WrapWithSshAgent(const std::vector<std::string>& args,
                                          const std::string& key_path,
                                          const std::string& auth_sock) {
    const auto quoted_key = utils::ShellQuote(key_path);
    std::string script = "ssh-add " + quoted_key + " && rm -f " + quoted_key;
    if (!args.empty()) {
        script += " && " + utils::ArgsToCommandLine(args);
    }
    return {"ssh-agent", "-a", auth_sock, "sh", "-c", script};
}

}  // namespace playrun::jobs
