#pragma once

#include "../dag/node.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace pipeforge {
namespace runtime {

// original name -> staged file path
using PathMapping = std::map<std::string, std::string>;

/**
 * Uploads held in memory by source.load nodes: path -> inline text.
 * Blank uploads are skipped; a repeated path keeps its first upload.
 */
std::map<std::string, std::string> inline_uploads(const std::vector<dag::Node>& nodes);

/**
 * Scoped temporary directory for materializing uploads.
 *
 * The directory is created on the first non-empty stage() call and
 * removed, with everything in it, when the StagingArea is destroyed.
 */
class StagingArea {
public:
    // root empty = system temp directory
    explicit StagingArea(std::string root = "", std::string prefix = "pipeforge_uploads_");
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    /**
     * Writes every blob to <dir>/<n>/<base name of its key> and returns
     * key -> written path. Throws std::runtime_error on I/O failure.
     */
    PathMapping stage(const std::map<std::string, std::string>& blobs);

    // Empty until something has been staged
    const std::filesystem::path& directory() const { return directory_; }

private:
    void create_directory();

    std::string root_;
    std::string prefix_;
    std::filesystem::path directory_;
    size_t next_slot_ = 0;
};

} // namespace runtime
} // namespace pipeforge
