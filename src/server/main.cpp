#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "common/secret_loader.hpp"
#include "server/http_server.hpp"
#include "server/service_builder.hpp"
#include "server/token_http_handler.hpp"

#include "config_path.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("VOICE_TOKEN_SERVER_CONFIG")) {
        config_path = env;
    } else {
        config_path = voicetoken::common::GetConfigPath("app.example.json");
    }

    voicetoken::common::AppConfig config;
    try {
        config = voicetoken::common::ConfigLoader::Load(config_path);
        voicetoken::common::ConfigLoader::ApplyEnvOverrides(config);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    voicetoken::common::InitLogger(config.logging);
    VOICETOKEN_LOG_INFO("Voice token server starting with config {}", config_path);

    if (!config.secrets.file.empty()) {
        auto secrets = voicetoken::common::SecretLoader::LoadFile(config.secrets.file);
        if (secrets.IsOk()) {
            voicetoken::common::SecretLoader::Apply(secrets.Value(), config);
            VOICETOKEN_LOG_INFO("Loaded media secrets from {}", config.secrets.file);
        } else {
            VOICETOKEN_LOG_WARN("Secrets document unavailable, keeping configured values: {}",
                                voicetoken::common::ToString(secrets.GetStatus()));
        }
    }

    for (const auto& problem : voicetoken::common::ValidateConfig(config)) {
        VOICETOKEN_LOG_WARN("Config: {}", problem);
    }

    auto key_store = voicetoken::server::CreateKeyStore(config.key_store);
    auto media = voicetoken::server::CreateMediaService(config.media);
    auto token_service = voicetoken::server::BuildTokenService(config, key_store, media);
    auto handler = std::make_shared<voicetoken::server::TokenHttpHandler>(token_service);

    voicetoken::server::HttpServer server(config.server, [handler](const voicetoken::server::HttpRequest& req) {
        return handler->Handle(req);
    });
    auto status = server.Start();
    if (!status.IsOk()) {
        VOICETOKEN_LOG_ERROR("Failed to start HTTP server on {}:{}: {}",
                             config.server.host, config.server.port, status.Message());
        voicetoken::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    VOICETOKEN_LOG_INFO("Voice token server listening on {}:{} (default agent: {})",
                        config.server.host, server.Port(), config.agents.default_agent);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    while (g_stop_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    VOICETOKEN_LOG_WARN("Signal {} received, shutting down HTTP server...", static_cast<int>(g_stop_signal));
    server.Stop();
    voicetoken::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
