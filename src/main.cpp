#include "headers.hpp"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [settings.json]" << std::endl;
        return 2;
    }
    const std::string settingsPath = argc == 2 ? argv[1] : "settings.json";

    Settings settings = loadSettings(settingsPath);

    MainLoop loop;
    auto dispatch = [&loop](std::function<void()> task) { loop.post(std::move(task)); };

    StateContainer state;
    SteadyClock clock;
    WhisperSessionFactory recognizers(settings.session);

    ConsoleConsent consent(std::cout, settings.microphoneConsent, [&settings, &settingsPath] {
        settings.microphoneConsent = true;
        if (!saveSettings(settings, settingsPath)) {
            std::cerr << "[Main] [WARN] Microphone consent will not be remembered" << std::endl;
        }
    });

    RecognitionEventRouter router(state, recognizers, consent, clock, dispatch, settings.transcript);
    TerminalView view(std::cout);
    ConsoleApp app(loop, state, router, consent, view);

    // Declared last so a load still in flight is joined before anything it reports to goes away
    ModelLoader loader(dispatch);

    router.onModelLoading();
    const ModelPreparer preparer(settings.model);
    const WhisperModel::Params whisperParams = settings.whisper;
    loader.loadAsync(
        [preparer, whisperParams]() -> std::shared_ptr<SpeechModel> {
            preparer.prepare();
            return std::make_shared<WhisperModel>(preparer.modelFilePath().string(), whisperParams);
        },
        [&router](std::shared_ptr<SpeechModel> model) { router.onModelReady(std::move(model)); },
        [&router](const std::string& message) { router.onModelFailed(message); });

    std::cout << "\nwhispernotes: press enter to start or stop recording, q to quit." << std::endl;
    app.run(std::cin);

    return 0;
}
