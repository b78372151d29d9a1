#ifndef MODEL_LOADER_HPP
#define MODEL_LOADER_HPP

#include "stt/recognition.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

// Prepares and constructs the speech model on a background thread and reports
// the outcome exactly once on the UI context.
class ModelLoader {
public:
    using Build = std::function<std::shared_ptr<SpeechModel>()>;
    using Dispatcher = std::function<void(std::function<void()>)>;
    using OnReady = std::function<void(std::shared_ptr<SpeechModel>)>;
    using OnFailed = std::function<void(const std::string& message)>;

    explicit ModelLoader(Dispatcher dispatch);
    ~ModelLoader();

    ModelLoader(const ModelLoader&) = delete;
    ModelLoader& operator=(const ModelLoader&) = delete;

    void loadAsync(Build build, OnReady onReady, OnFailed onFailed);

private:
    Dispatcher dispatch_;
    std::thread thread_;
};

#endif
