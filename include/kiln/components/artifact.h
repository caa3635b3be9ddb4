#pragma once

#include <kiln/core/types.h>

#include <string>
#include <vector>

namespace kiln::components {

/**
 * Result of a build: a set of files or a remote identifier produced by a
 * builder and handed through the post-processor chain.
 */
class IArtifact {
public:
    virtual ~IArtifact() = default;

    // Id of the builder that produced the artifact.
    virtual std::string builderId() const = 0;
    virtual std::vector<std::string> files() const = 0;
    virtual std::string id() const = 0;

    // Human readable description, shown at the end of a build.
    virtual std::string string() const = 0;

    virtual Result<void> destroy() = 0;
};

/**
 * Plain artifact for components that produce a fixed description.
 */
class BasicArtifact : public IArtifact {
public:
    BasicArtifact(std::string builderId, std::string id, std::vector<std::string> files,
                  std::string description)
        : builderId_(std::move(builderId)), id_(std::move(id)), files_(std::move(files)),
          description_(std::move(description)) {}

    std::string builderId() const override { return builderId_; }
    std::vector<std::string> files() const override { return files_; }
    std::string id() const override { return id_; }
    std::string string() const override { return description_; }

    // Removes the artifact's files.
    Result<void> destroy() override;

private:
    std::string builderId_;
    std::string id_;
    std::vector<std::string> files_;
    std::string description_;
};

} // namespace kiln::components
