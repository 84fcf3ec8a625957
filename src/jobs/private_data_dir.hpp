#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

namespace playrun::jobs {

// Per-run scratch directory for secret material. Removed on Close() or destruction.
class PrivateDataDir {
public:
    static PrivateDataDir Open(const std::string& root);

    PrivateDataDir(PrivateDataDir&& other) noexcept;
    PrivateDataDir& operator=(PrivateDataDir&& other) noexcept;
    PrivateDataDir(const PrivateDataDir&) = delete;
    PrivateDataDir& operator=(const PrivateDataDir&) = delete;
    ~PrivateDataDir();

    const std::string& Path() const { return path_; }
    bool IsOpen() const { return !path_.empty(); }
    std::string AuthSockPath() const;

    std::string WriteSecret(const std::string& name, const std::string& data, mode_t mode = 0600);
    std::string WriteTempSecret(const std::string& prefix, const std::string& data);
    std::string MakeScratchDir(const std::string& prefix);

    void Close() noexcept;

private:
    explicit PrivateDataDir(std::string path);

    std::string path_;
};

// ssh-agent -a <sock> sh -c "ssh-add <key> && rm -f <key> && <args>"
std::vector<std::string> WrapWithSshAgent(const std::vector<std::string>& args,
                                          const std::string& key_path,
                                          const std::string& auth_sock);

}  // namespace playrun::jobs
