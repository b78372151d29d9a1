#include <catch2/catch_test_macros.hpp>

#include <app/settings.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace settings {

namespace fs = std::filesystem;

struct TempFile {
    fs::path path;

    explicit TempFile(const std::string& name) : path(fs::temp_directory_path() / name) { fs::remove(path); }
    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& text) const {
        std::ofstream out(path);
        out << text;
    }
};

TEST_CASE("Missing settings file yields defaults", "[settings]") {
    TempFile file("whispernotes-settings-missing.json");
    const Settings s = loadSettings(file.path.string());

    CHECK(s.model.modelName == "model-en");
    CHECK(s.whisper.language == "en");
    CHECK(s.transcript.throttleMs == 2000);
    CHECK_FALSE(s.transcript.stopOnFinalResult);
    CHECK_FALSE(s.microphoneConsent);
}

TEST_CASE("Keys override defaults one by one", "[settings]") {
    TempFile file("whispernotes-settings-partial.json");
    file.write(R"({
        "model": { "name": "model-hi" },
        "whisper": { "language": "hi", "threads": 2 },
        "audio": { "stopHangMs": 800 },
        "session": { "silenceTimeoutMs": 15000 },
        "transcript": { "stopOnFinalResult": true },
        "microphoneConsent": true
    })");

    const Settings s = loadSettings(file.path.string());
    CHECK(s.model.modelName == "model-hi");
    CHECK(s.model.assetsDir == "assets");
    CHECK(s.whisper.language == "hi");
    CHECK(s.whisper.threads == 2);
    CHECK(s.session.audio.stopHangMs == 800);
    CHECK(s.session.audio.startHangMs == 80);
    CHECK(s.session.silenceTimeoutMs == 15000);
    CHECK(s.transcript.stopOnFinalResult);
    CHECK(s.transcript.throttleMs == 2000);
    CHECK(s.microphoneConsent);
}

TEST_CASE("Malformed settings fall back to defaults", "[settings]") {
    TempFile file("whispernotes-settings-bad.json");
    file.write("{ \"whisper\": { \"threads\": ");

    const Settings s = loadSettings(file.path.string());
    CHECK(s.whisper.threads == 4);
}

TEST_CASE("Saved settings load back", "[settings]") {
    TempFile file("whispernotes-settings-saved.json");

    Settings s;
    s.microphoneConsent = true;
    s.model.dataDir = "/var/lib/whispernotes";
    s.session.partialIntervalMs = 750;
    REQUIRE(saveSettings(s, file.path.string()));

    const Settings loaded = loadSettings(file.path.string());
    CHECK(loaded.microphoneConsent);
    CHECK(loaded.model.dataDir == "/var/lib/whispernotes");
    CHECK(loaded.session.partialIntervalMs == 750);
}

} // namespace settings
