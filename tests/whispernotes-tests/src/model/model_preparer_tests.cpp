#include <catch2/catch_test_macros.hpp>

#include <model/model_preparer.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace model_preparer {

namespace fs = std::filesystem;

struct Sandbox {
    fs::path root;

    explicit Sandbox(const std::string& name) : root(fs::temp_directory_path() / name) {
        fs::remove_all(root);
        fs::create_directories(root);
    }
    ~Sandbox() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeFile(const fs::path& rel, const std::string& text) const {
        fs::create_directories((root / rel).parent_path());
        std::ofstream out(root / rel, std::ios::binary);
        out << text;
    }

    ModelPreparer::Config config() const {
        ModelPreparer::Config c;
        c.assetsDir = (root / "assets").string();
        c.dataDir = (root / "data").string();
        c.modelName = "model-en";
        c.modelFile = "ggml-tiny.bin";
        return c;
    }
};

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TEST_CASE("Model directory is copied recursively", "[model]") {
    Sandbox box("whispernotes-preparer-copy");
    box.writeFile("assets/model-en/ggml-tiny.bin", "weights");
    box.writeFile("assets/model-en/conf/model.conf", "beam=5");
    box.writeFile("assets/model-en/graph/phones/word_boundary.int", "1 nonword");

    ModelPreparer preparer(box.config());
    const fs::path out = preparer.prepare();

    CHECK(out == box.root / "data" / "model-en");
    CHECK(readFile(out / "ggml-tiny.bin") == "weights");
    CHECK(readFile(out / "conf" / "model.conf") == "beam=5");
    CHECK(readFile(out / "graph" / "phones" / "word_boundary.int") == "1 nonword");
    CHECK(preparer.modelFilePath() == out / "ggml-tiny.bin");
}

TEST_CASE("A non-empty destination is reused untouched", "[model]") {
    Sandbox box("whispernotes-preparer-reuse");
    box.writeFile("assets/model-en/ggml-tiny.bin", "new weights");
    box.writeFile("data/model-en/ggml-tiny.bin", "old weights");

    ModelPreparer preparer(box.config());
    const fs::path out = preparer.prepare();

    CHECK(readFile(out / "ggml-tiny.bin") == "old weights");
}

TEST_CASE("An empty destination directory is filled", "[model]") {
    Sandbox box("whispernotes-preparer-empty");
    box.writeFile("assets/model-en/ggml-tiny.bin", "weights");
    fs::create_directories(box.root / "data" / "model-en");

    ModelPreparer preparer(box.config());
    CHECK(readFile(preparer.prepare() / "ggml-tiny.bin") == "weights");
}

TEST_CASE("Preparing twice copies once", "[model]") {
    Sandbox box("whispernotes-preparer-twice");
    box.writeFile("assets/model-en/ggml-tiny.bin", "weights");

    ModelPreparer preparer(box.config());
    preparer.prepare();
    box.writeFile("assets/model-en/ggml-tiny.bin", "changed");
    preparer.prepare();

    CHECK(readFile(preparer.modelFilePath()) == "weights");
}

TEST_CASE("Missing model assets fail preparation", "[model]") {
    Sandbox box("whispernotes-preparer-missing");

    ModelPreparer preparer(box.config());
    CHECK_THROWS_AS(preparer.prepare(), ModelPreparationError);
    CHECK_FALSE(fs::exists(preparer.destinationDir()));
}

} // namespace model_preparer
