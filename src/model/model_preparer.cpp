#include "model/model_preparer.hpp"

#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

// Constructor
ModelPreparer::ModelPreparer(Config config) : config_(std::move(config)) {}

fs::path ModelPreparer::sourceDir() const { return fs::path(config_.assetsDir) / config_.modelName; }

fs::path ModelPreparer::destinationDir() const { return fs::path(config_.dataDir) / config_.modelName; }

fs::path ModelPreparer::modelFilePath() const { return destinationDir() / config_.modelFile; }

fs::path ModelPreparer::prepare() const {
    const fs::path to = destinationDir();
    if (isNonEmptyDirectory(to)) {
        std::cout << "[Model] Using existing " << to.string() << std::endl;
        return to;
    }

    const fs::path from = sourceDir();
    std::error_code ec;
    if (!fs::exists(from, ec)) {
        throw ModelPreparationError("model assets not found: " + from.string());
    }

    std::cout << "[Model] Copying " << from.string() << " -> " << to.string() << std::endl;
    copyTree(from, to);
    return to;
}

bool ModelPreparer::isNonEmptyDirectory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return false;
    return !fs::is_empty(dir, ec) && !ec;
}

// Recursive copy; a plain-file source is copied to the destination path itself
void ModelPreparer::copyTree(const fs::path& from, const fs::path& to) {
    std::error_code ec;

    if (!fs::is_directory(from, ec)) {
        if (to.has_parent_path()) fs::create_directories(to.parent_path(), ec);
        ec.clear();
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (ec) throw ModelPreparationError("copy " + from.string() + " failed: " + ec.message());
        return;
    }

    fs::create_directories(to, ec);
    if (ec) throw ModelPreparationError("mkdir " + to.string() + " failed: " + ec.message());

    for (fs::directory_iterator it(from, ec), end; !ec && it != end; it.increment(ec)) {
        copyTree(it->path(), to / it->path().filename());
    }
    if (ec) throw ModelPreparationError("listing " + from.string() + " failed: " + ec.message());
}
