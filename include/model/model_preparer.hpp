#ifndef MODEL_PREPARER_HPP
#define MODEL_PREPARER_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

class ModelPreparationError : public std::runtime_error {
public:
    explicit ModelPreparationError(const std::string& what) : std::runtime_error(what) {}
};

// Copies the bundled model directory into writable storage once.
class ModelPreparer {
public:
    struct Config {
        std::string assetsDir = "assets";
        std::string dataDir = "data";
        std::string modelName = "model-en";
        std::string modelFile = "ggml-base.en-q5_1.bin";
    };

    explicit ModelPreparer(Config config);

    // Returns the writable model directory. An existing non-empty directory is
    // reused as is. Throws ModelPreparationError if the copy fails.
    std::filesystem::path prepare() const;

    // Path to the model file inside the prepared directory.
    std::filesystem::path modelFilePath() const;

    std::filesystem::path sourceDir() const;
    std::filesystem::path destinationDir() const;

private:
    static bool isNonEmptyDirectory(const std::filesystem::path& dir);
    static void copyTree(const std::filesystem::path& from, const std::filesystem::path& to);

    Config config_;
};

#endif
