#pragma once

#include "io/io.hpp"

#include <memory>
#include <string>
#include <vector>

namespace filepipe {

// IFileSystem over a local directory tree.
class OsFileSystem final : public IFileSystem {
public:
    explicit OsFileSystem(std::string root) : root_(std::move(root)) {}

    Result Open(const std::string& name, std::unique_ptr<IFile>& out) override;
    Result ReadDir(const std::string& name, std::vector<FileInfo>& out) override;

    const std::string& Root() const { return root_; }

private:
    Result Resolve(const std::string& name, std::string& path) const;

    std::string root_;
};

} // namespace filepipe
