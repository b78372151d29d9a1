#include "model/model_loader.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Constructor
ModelLoader::ModelLoader(Dispatcher dispatch) : dispatch_(std::move(dispatch)) {}

// Destructor. Waits for a load still in flight
ModelLoader::~ModelLoader() {
    if (thread_.joinable()) thread_.join();
}

void ModelLoader::loadAsync(Build build, OnReady onReady, OnFailed onFailed) {
    if (thread_.joinable()) thread_.join();

    thread_ = std::thread([this, build = std::move(build), onReady = std::move(onReady),
                           onFailed = std::move(onFailed)]() {
        std::shared_ptr<SpeechModel> model;
        std::string error;
        bool failed = false;
        try {
            model = build();
            if (!model) {
                failed = true;
                error = "model construction returned nothing";
            }
        } catch (const std::exception& e) {
            failed = true;
            error = e.what();
        }

        if (failed) {
            std::cerr << "[Model Loader] [ERROR] " << error << std::endl;
            dispatch_([onFailed, error]() { onFailed(error); });
            return;
        }
        dispatch_([onReady, model]() { onReady(model); });
    });
}
