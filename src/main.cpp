#include "headers.hpp"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {

    DaemonConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const SessionError& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]) << std::endl;
        return 2;
    }

    if (config.verbose) setLogLevel(LogLevel::Debug);

    // Session controller init
    SessionController controller(WhisperModel::loader(config.whisper),
                                 std::make_unique<PortAudioCapture>(config.capture),
                                 config.session);

    const Outcome loaded = controller.loadModel(config.modelPath);
    if (!loaded) {
        logError("Main", loaded.message);
        return 1;
    }

    // Host bridge init
    CommandDispatcher dispatcher(controller);
    CommandServer server(config.bindIp, config.port,
        [&](const std::string& payload) { return dispatcher.handle(payload); });

    const EventBus::SubscriptionId subscription = controller.events().subscribeAll([&](const SessionEvent& event) {
        if (event.type == EventType::PartialResult || event.type == EventType::FinalResult) {
            logInfo("Main", std::string(eventName(event.type)) + ": " + CommandDispatcher::encodeEvent(event));
        }
        server.sendToActive(CommandDispatcher::encodeEvent(event));
    });

    if (!server.start()) {
        controller.events().unsubscribe(subscription);
        return 1;
    }

    if (config.autoStartOptions) {
        try {
            const Outcome started = controller.start(parseStartOptions(*config.autoStartOptions));
            if (!started) logError("Main", std::string(errorKindName(started.kind)) + ": " + started.message);
        } catch (const SessionError& e) {
            logError("Main", e.what());
        }
    }

    std::string text;
    std::cout << "\nVoice session running... Press enter to quit." << std::endl;
    std::getline(std::cin, text);

    controller.stop();
    controller.waitForIdle();
    controller.events().unsubscribe(subscription);
    controller.events().flush();
    server.stop();
    return 0;
}
