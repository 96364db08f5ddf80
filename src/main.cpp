#include "audio/audio_pipeline.h"
#include "audio_io.h"
#include "config.h"
#include "context/context_augmentation_engine.h"
#include "context/intent_classifier.h"
#include "context/tag_extractor.h"
#include "live/gemini_live_channel.h"
#include "llm_client.h"
#include "logger.h"
#include "memory/memory_store_client.h"
#include "net/websocket_transport.h"
#include "path_utils.h"
#include "session/event_log.h"
#include "session/prompts.h"
#include "session/session_orchestrator.h"
#include "tool_registry.h"
#include "tools/commit_memory_tool.h"
#include "tools/retrieve_memory_tool.h"
#include "utils.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <memory>

int main(int argc, char* argv[]) {
    voxlink::Logger::initialize(voxlink::LogLevel::INFO);

    // List devices if requested (check before loading config)
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        voxlink::AudioIO::list_devices();
        voxlink::Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : voxlink::locate_config_file("config/config.json");
    voxlink::Config config = voxlink::Config::load_from_file(config_path);

    voxlink::Logger::configure(voxlink::Logger::parse_level(config.log_level), config.log_file);

    if (config.live.system_instruction.empty()) {
        config.live.system_instruction = voxlink::default_system_instruction();
    }

    boost::asio::io_context ioc;

    // Memory core
    voxlink::WebSocketTransport memory_transport(ioc, config.memory_store.url);
    voxlink::MemoryStoreClient memory(memory_transport, config.memory_store);

    // Classifier and tagger share one HTTPS client
    voxlink::LLMClient llm(ioc, config.classifier);
    voxlink::LlmIntentClassifier classifier(llm);
    voxlink::LlmTagExtractor tagger(llm);
    voxlink::ContextAugmentationEngine engine(classifier, memory);

    voxlink::EventLog event_log(config.session.log_capacity);

    voxlink::ToolRegistry tools;
    tools.register_tool(std::make_shared<voxlink::CommitMemoryTool>(memory, tagger, event_log));
    tools.register_tool(std::make_shared<voxlink::RetrieveMemoryTool>(memory));
    voxlink::Logger::info("Tools: " + voxlink::utils::join(tools.get_tool_names(), ", "));

    // Speech channel
    voxlink::LiveSetup setup;
    setup.model = config.live.model;
    setup.voice_name = config.live.voice_name;
    setup.system_instruction = config.live.system_instruction;
    setup.function_declarations_json = tools.get_function_declarations_json();
    setup.capture_wire_rate = config.audio.capture_wire_rate;

    voxlink::WebSocketTransport live_transport(ioc, config.live.endpoint + "?key=" + config.live.api_key);
    voxlink::GeminiLiveChannel channel(live_transport, setup);

    // Audio
    voxlink::AudioIO device(config.audio);
    voxlink::AudioPipeline audio(device, config.audio, config.effects);

    voxlink::SessionOrchestrator session(ioc, config, channel, audio, memory, engine, tools, event_log);

    // The process lives as long as the session
    event_log.subscribe([&](const voxlink::LogEntry&) {
        voxlink::ConnectionState state = session.connection_state();
        if (state == voxlink::ConnectionState::Disconnected || state == voxlink::ConnectionState::Error) {
            boost::asio::post(ioc, [&ioc]() { ioc.stop(); });
        }
    });

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        voxlink::Logger::info("Shutting down...");
        session.disconnect();
        memory.disconnect();
        ioc.stop();
    });

    boost::asio::post(ioc, [&session]() { session.connect(); });

    voxlink::Logger::info("voxlink started (config: " + config_path + ")");
    ioc.run();

    voxlink::Logger::shutdown();
    return 0;
}
