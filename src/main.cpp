#include "config.hpp"
#include "console.hpp"
#include "settings.hpp"
#include "verbose.hpp"
#include "chat/chat_client.hpp"
#include "chat/chat_service.hpp"
#include "search/web_search_client.hpp"
#include "transport/curl_transport.hpp"

#include <CLI/CLI.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <unistd.h>

using namespace mllm;

// ========== Signal Handling ==========

static std::atomic<bool> g_streaming{false};    // A turn is in flight.
static std::atomic<bool> g_interrupted{false};  // Ctrl+C seen during a turn.

// First Ctrl+C during a turn cancels it; a second one, or one at the prompt, leaves.
void signal_handler(int) {
    if (g_streaming.load() && !g_interrupted.load()) {
        g_interrupted.store(true);
        return;
    }
    const char newline = '\n';
    [[maybe_unused]] auto written = write(STDOUT_FILENO, &newline, 1);
    std::_Exit(130);
}

// ========== Turn Handling ==========

struct TurnResult {
    std::string text;
    bool failed = false;
    bool cancelled = false;
};

// Streams one turn to the console until Done, Error or Ctrl+C.
TurnResult run_turn(chat::ChatService& service,
                    const chat::ApiConfig& config,
                    const chat::WebSearchConfig& search_config,
                    const std::vector<chat::HistoryMessage>& history,
                    bool show_reasoning,
                    const Console& console) {
    TurnResult result;
    bool in_reasoning = false;

    g_interrupted.store(false);
    g_streaming.store(true);
    auto stream = service.start_turn(config, search_config, history);

    while (true) {
        if (g_interrupted.load()) {
            stream->cancel();
            result.cancelled = true;
            break;
        }

        chat::StreamEvent event;
        auto status = stream->next_for(event, std::chrono::milliseconds(100));
        if (status == chat::EventChannel::ReceiveStatus::Timeout) {
            continue;
        }
        if (status == chat::EventChannel::ReceiveStatus::Closed) {
            break;
        }

        std::visit(chat::overloaded{
            [&](const chat::events::Content& e) {
                if (in_reasoning) {
                    console.print_raw("\n\n");
                    in_reasoning = false;
                }
                console.print_raw(e.text);
                result.text += e.text;
            },
            [&](const chat::events::Reasoning& e) {
                if (show_reasoning) {
                    console.print_reasoning(e.text);
                    in_reasoning = true;
                }
            },
            [&](const chat::events::Error& e) {
                console.println();
                console.print_error("Error: " + e.message);
                result.failed = true;
            },
            [&](const chat::events::ToolCallRequested& e) {
                verbose_log("MAIN", "Tool call " + e.name + " handled by the loop");
            },
            [&](const chat::events::WebSearchStarted&) {
                console.println();
                console.print_info("Searching the web...");
            },
            [&](const chat::events::Done&) {
                console.println();
            }
        }, event);
    }

    stream.reset();
    g_streaming.store(false);

    if (result.cancelled) {
        console.println();
        console.print_warning("Cancelled.");
    }
    return result;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Streaming chat client for OpenAI-compatible APIs with web search"};
    app.footer("\nExamples:\n"
               "  mllm-chat                              Chat with the active provider\n"
               "  mllm-chat --web-search                 Let the model search the web\n"
               "  mllm-chat --list-models                List the provider's models\n"
               "  echo 'Hi' | mllm-chat -n               One answer on stdout\n");

    std::string config_path = SETTINGS_FILE;
    app.add_option("-c,--config", config_path, "Settings file (default: .mllm.json)");

    std::string provider_name;
    app.add_option("--provider", provider_name, "Provider id or name from the settings file");

    std::string base_url;
    app.add_option("--base-url", base_url, "API base URL (e.g. https://api.openai.com/v1)");

    std::string model;
    app.add_option("--model", model, "Model to use");

    std::string system_prompt;
    app.add_option("--system", system_prompt, "System prompt");

    float temperature = 0.0f;
    auto* temperature_opt = app.add_option("--temperature", temperature, "Sampling temperature")
        ->check(CLI::Range(0.0, 2.0));

    int max_tokens = 0;
    auto* max_tokens_opt = app.add_option("--max-tokens", max_tokens, "Maximum tokens per response")
        ->check(CLI::PositiveNumber);

    bool web_search = false;
    app.add_flag("--web-search", web_search, "Offer the web_search tool to the model");

    std::string search_provider;
    app.add_option("--search-provider", search_provider, "Search provider")
        ->check(CLI::IsMember({"brave", "tavily", "synthetic"}));

    bool show_reasoning = false;
    app.add_flag("--show-reasoning", show_reasoning, "Print reasoning text from reasoning models");

    bool list_models = false;
    app.add_flag("--list-models", list_models, "List available models and exit");

    bool test_connection = false;
    app.add_flag("--test-connection", test_connection, "Check the API key and endpoint and exit");

    bool non_interactive = false;
    app.add_flag("-n,--non-interactive", non_interactive,
                 "Read the message from stdin, write the answer to stdout, exit");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log HTTP and stream traffic to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    // ========== Configuration ==========

    Settings settings;
    bool have_settings_file = false;
    try {
        if (auto loaded = load_settings(config_path)) {
            settings = *loaded;
            have_settings_file = true;
        }
    } catch (const SettingsError& e) {
        console.print_error(e.what());
        return 1;
    }

    Provider* stored_provider = provider_name.empty()
        ? settings.active_provider()
        : settings.find_provider(provider_name);
    if (!provider_name.empty() && !stored_provider) {
        console.print_error("Unknown provider: " + provider_name);
        return 1;
    }

    Provider provider = stored_provider ? *stored_provider : Provider{};
    if (!base_url.empty()) provider.base_url = base_url;
    if (!model.empty()) provider.selected_model = model;
    if (!system_prompt.empty()) provider.system_prompt = system_prompt;
    if (*temperature_opt) provider.temperature = temperature;
    if (*max_tokens_opt) provider.max_tokens = max_tokens;

    if (provider.api_key.empty()) {
        if (const char* key = std::getenv(API_KEY_ENV)) {
            provider.api_key = key;
        }
    }

    chat::ApiConfig config = provider.to_api_config();

    chat::WebSearchConfig search_config = settings.web_search;
    if (web_search) search_config.enabled = true;
    if (!search_provider.empty()) search_config.provider = search_provider;
    if (search_config.api_key.empty()) {
        if (const char* key = std::getenv(SEARCH_API_KEY_ENV)) {
            search_config.api_key = key;
        }
    }
    if (search_config.enabled && search_config.api_key.empty()) {
        console.print_warning(std::string("Web search needs an API key; set ") + SEARCH_API_KEY_ENV +
                              " or web_search.api_key. Continuing without it.");
    }

    if (!config.is_configured()) {
        console.print_error(std::string("Error: no API key configured. Set ") + API_KEY_ENV +
                            " or add a provider to " + config_path);
        return 1;
    }

    verbose_log("MAIN", "Provider " + (config.provider_name.empty() ? std::string("(default)") : config.provider_name) +
                ", model " + config.model + ", base " + config.normalized_base_url());

    transport::CurlTransport transport;
    chat::ChatClient client(transport);
    search::WebSearchClient search(transport);
    chat::ChatService service(client, search);

    // ========== One-shot Commands ==========

    if (list_models) {
        auto result = client.fetch_models(config);
        if (auto* error = std::get_if<chat::ApiError>(&result)) {
            console.print_error("Failed to fetch models: " + error->message);
            return 1;
        }
        const auto& models = std::get<std::vector<std::string>>(result);
        for (const auto& id : models) {
            console.println(id);
        }

        if (stored_provider && have_settings_file) {
            stored_provider->available_models = models;
            stored_provider->last_fetched_models = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            try {
                save_settings(settings, config_path);
            } catch (const SettingsError& e) {
                console.print_warning(e.what());
            }
        }
        return 0;
    }

    if (test_connection) {
        auto result = client.test_connection(config);
        return std::visit(chat::overloaded{
            [&](const std::string& reply) {
                console.print_success("Connected to " + config.normalized_base_url() + " (" + config.model + ")");
                console.println(reply);
                return 0;
            },
            [&](const chat::ApiError& error) {
                console.print_error("Connection failed: " + error.message);
                return 1;
            }
        }, result);
    }

    std::signal(SIGINT, signal_handler);

    // ========== Non-interactive Mode ==========

    if (non_interactive) {
        std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        size_t start = input.find_first_not_of(" \t\n\r");
        if (start == std::string::npos) {
            return 0;
        }
        size_t end = input.find_last_not_of(" \t\n\r");
        input = input.substr(start, end - start + 1);

        TurnResult result = run_turn(service, config, search_config, {{"user", input}}, false, console);
        return (result.failed || result.cancelled) ? 1 : 0;
    }

    // ========== Interactive Chat Loop ==========

    console.print_header("=== mllm chat: " + config.model + " ===");
    console.println("Type 'quit' to exit. Ctrl+C cancels a reply in progress.");
    console.println();

    std::vector<chat::HistoryMessage> history;
    std::string title;

    while (true) {
        std::string user_input;
        if (!console.read_line("> ", user_input)) {
            console.println();
            break;
        }

        size_t start = user_input.find_first_not_of(" \t\n\r");
        if (start == std::string::npos) {
            continue;
        }
        size_t end = user_input.find_last_not_of(" \t\n\r");
        user_input = user_input.substr(start, end - start + 1);

        if (user_input == "quit" || user_input == "exit") {
            console.println("Goodbye.");
            break;
        }

        if (title.empty()) {
            title = chat::generate_title(user_input);
            console.print_info("Conversation: " + title);
        }

        history.push_back({"user", user_input});
        TurnResult result = run_turn(service, config, search_config, history, show_reasoning, console);

        if (result.failed || result.cancelled) {
            // The failed exchange is not resent with the next message.
            history.pop_back();
        } else {
            history.push_back({"assistant", result.text});
        }
        console.println();
    }

    return 0;
}
