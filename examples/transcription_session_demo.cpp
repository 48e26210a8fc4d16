#include "collabscribe/core/session_coordinator.hpp"
#include "collabscribe/utils/config.hpp"
#include "collabscribe/utils/logging.hpp"
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>
#include <chrono>
#include <vector>

using namespace collabscribe;
using namespace collabscribe::core;

namespace {

class DemoAuthorizer : public RecognitionAuthorizer {
public:
    bool isAuthorized() const override { return true; }
};

class ConsoleBroadcaster : public TranscriptBroadcaster {
public:
    void broadcastSegment(const TranscriptionSegment& segment) override {
        std::cout << "  [broadcast] " << (segment.isFinal ? "final  " : "interim")
                  << " " << segment.participantName << ": " << segment.content << std::endl;
    }
};

constexpr double kPi = 3.14159265358979323846;

std::vector<float> sineFrame(float frequency, float amplitude, size_t length = 480) {
    std::vector<float> frame(length);
    for (size_t i = 0; i < length; ++i) {
        frame[i] = amplitude * static_cast<float>(std::sin(2.0 * kPi * frequency * i / 16000.0));
    }
    return frame;
}

} // namespace

class TranscriptionSessionDemo {
public:
    explicit TranscriptionSessionDemo(const utils::TranscriptionConfig& config)
        : coordinator_(config, std::make_shared<DemoAuthorizer>(), nullptr,
                       std::make_shared<ConsoleBroadcaster>()) {
        coordinator_.setEventCallback([](const TranscriptionEvent& event) {
            if (event.type == TranscriptionEventType::QUALITY_CHANGED) {
                std::cout << "  [event] quality " << event.previousQuality << " -> " << event.quality << std::endl;
            } else if (event.type == TranscriptionEventType::SPEAKER_IDENTIFIED) {
                std::cout << "  [event] speaker " << event.speakerId
                          << " (" << event.speakerConfidence << ")" << std::endl;
            }
        });
    }

    bool runExample() {
        std::cout << "\n1. Starting session..." << std::endl;
        SessionContext context;
        context.sessionId = "weekly-sync";
        context.roomName = "Weekly Sync";
        context.localParticipantId = "alice";
        context.participants = {{"alice", "Alice"}, {"bob", "Bob"}};

        auto result = coordinator_.start(context);
        if (!result.success) {
            std::cerr << "Failed to start session: " << result.message << std::endl;
            return false;
        }
        std::cout << "   Session " << coordinator_.getSessionId() << " is "
                  << sessionStateToString(coordinator_.getState()) << std::endl;

        std::cout << "\n2. Feeding audio frames..." << std::endl;
        for (int i = 0; i < 5; ++i) {
            coordinator_.ingestAudioFrame("alice", sineFrame(220.0f, 0.2f));
            coordinator_.ingestAudioFrame("bob", sineFrame(880.0f, 0.05f));
        }
        auto match = coordinator_.identifySpeaker(
            audio::SimpleFeatureExtractor().extract(sineFrame(220.0f, 0.2f)).toVector());
        std::cout << "   Best speaker match: " << match.speakerId << std::endl;
        std::cout << "   Audio quality: " << audio::qualityTierToString(coordinator_.currentQuality()) << std::endl;

        std::cout << "\n3. Simulating recognition events..." << std::endl;
        coordinator_.onPartial("alice", "so the release", 0.6f);
        coordinator_.flushInterimBuffers();
        coordinator_.onPartial("alice", "so the release is on track", 0.7f);
        coordinator_.onFinal("alice", "So the release is on track for Friday.", 0.93f);

        coordinator_.participantJoined("carol", "Carol");
        coordinator_.onFinal("bob", "Great, I'll update the changelog.", 0.88f);
        coordinator_.onPartial("carol", "one question about the migration", 0.65f);
        coordinator_.waitForIdle();

        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        std::cout << "\n4. Pausing Bob..." << std::endl;
        coordinator_.pause("bob");
        coordinator_.onFinal("bob", "this is not transcribed", 0.9f);
        coordinator_.resume("bob");

        std::cout << "\n5. Stopping session..." << std::endl;
        coordinator_.stop();

        auto summary = coordinator_.getSessionSummary();
        if (summary) {
            std::cout << "   Duration: " << summary->totalDuration << "s" << std::endl;
            for (const auto& entry : summary->participantStats) {
                const auto& stats = entry.second;
                std::cout << "   " << stats.participantName << ": " << stats.segmentCount << " segment(s), "
                          << stats.wordCount << " word(s), " << stats.totalSpeakingTime << "s" << std::endl;
            }
        }

        std::cout << "\n6. Exporting transcript..." << std::endl;
        for (ExportFormat format : {ExportFormat::TEXT, ExportFormat::SRT, ExportFormat::VTT, ExportFormat::JSON}) {
            std::cout << "--- " << exportFormatToString(format) << " ---" << std::endl;
            std::cout << coordinator_.exportTranscript(format) << std::endl;
        }

        const auto& diagnostics = coordinator_.getDiagnostics();
        std::cout << "\nDropped events: " << diagnostics.micDisabledEvents.load() << " paused, "
                  << diagnostics.unknownParticipantEvents.load() << " unknown" << std::endl;
        return true;
    }

private:
    SessionCoordinator coordinator_;
};

int main(int argc, char* argv[]) {
    std::cout << "Collaborative Transcription Session Demo" << std::endl;
    std::cout << "========================================" << std::endl;

    utils::TranscriptionConfigManager configManager;
    if (argc > 1) {
        if (configManager.loadFromFile(argv[1])) {
            std::cout << "Configuration loaded from: " << argv[1] << std::endl;
        } else {
            std::cout << "Failed to load configuration, using defaults" << std::endl;
        }
    }

    utils::TranscriptionConfig config = configManager.getConfig();
    utils::Logger::setLevel(utils::parseLogLevel(config.logLevel));

    try {
        TranscriptionSessionDemo demo(config);
        if (!demo.runExample()) {
            return 1;
        }
        std::cout << "\n=== Demo completed successfully ===" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Demo failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
