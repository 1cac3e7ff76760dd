#include "pipeforge_ir/runtime/staging.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace pipeforge {
namespace runtime {

namespace fs = std::filesystem;

std::map<std::string, std::string> inline_uploads(const std::vector<dag::Node>& nodes) {
    std::map<std::string, std::string> uploads;
    for (const auto& node : nodes) {
        const auto* load = std::get_if<dag::LoadSpec>(&node.payload);
        if (!load || !load->inline_text) continue;

        const std::string& text = *load->inline_text;
        bool blank = std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
        if (!blank) {
            uploads.emplace(load->path, text);
        }
    }
    return uploads;
}

StagingArea::StagingArea(std::string root, std::string prefix)
    : root_(std::move(root)), prefix_(std::move(prefix)) {}

StagingArea::~StagingArea() {
    if (directory_.empty()) return;

    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        spdlog::warn("Could not remove staging directory {}: {}", directory_.string(), ec.message());
    } else {
        spdlog::debug("Removed staging directory {}", directory_.string());
    }
}

void StagingArea::create_directory() {
    fs::path base = root_.empty() ? fs::temp_directory_path() : fs::path(root_);
    std::string pattern = (base / (prefix_ + "XXXXXX")).string();

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        throw std::runtime_error("Cannot create staging directory under " + base.string() + ": " +
                                 std::strerror(errno));
    }
    directory_ = fs::path(buffer.data());
    spdlog::debug("Created staging directory {}", directory_.string());
}

PathMapping StagingArea::stage(const std::map<std::string, std::string>& blobs) {
    PathMapping mapping;
    if (blobs.empty()) {
        return mapping;
    }
    if (directory_.empty()) {
        create_directory();
    }

    for (const auto& blob : blobs) {
        std::string file_name = fs::path(blob.first).filename().string();
        if (file_name.empty()) {
            file_name = "uploaded.csv";
        }

        // One subdirectory per blob so equal base names cannot collide
        fs::path slot = directory_ / std::to_string(next_slot_++);
        fs::create_directories(slot);
        fs::path target = slot / file_name;

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << blob.second;
        if (!out) {
            throw std::runtime_error("Failed writing staged upload " + target.string());
        }
        mapping[blob.first] = target.string();
    }

    spdlog::debug("Staged {} upload(s) in {}", mapping.size(), directory_.string());
    return mapping;
}

} // namespace runtime
} // namespace pipeforge
