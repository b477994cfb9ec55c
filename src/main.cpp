#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include "engine/config.hpp"
#include "engine/embedder.hpp"
#include "engine/index_handle.hpp"
#include "engine/indexer.hpp"
#include "engine/metrics.hpp"
#include "engine/retriever.hpp"
#include "engine/scanner.hpp"
#include <nlohmann/json.hpp>

namespace engine = retina::engine;

// Cancels in-flight generation on Ctrl-C.
engine::CancellationToken g_cancel;

void signal_handler(int signum) {
    g_cancel.cancel();
    std::signal(signum, SIG_DFL);
}

void print_usage() {
    std::cerr << "Usage: retina <command> [args...]\n";
    std::cerr << "Commands:\n";
    std::cerr << "  build [--force]                     - Index content_dir and save it as index_name\n";
    std::cerr << "  query <text> [k] [--no-generate]    - Query the saved index\n";
    std::cerr << "  list                                - List saved indexes\n";
    std::cerr << "  delete <name>                       - Delete a saved index\n";
    std::cerr << "  status                              - Show pipeline and index status\n";
    std::cerr << "Configuration is read from retina.json or the path in RETINA_CONFIG.\n";
}

// Paths and query text are printed as given; invalid UTF-8 is replaced, not fatal.
std::string to_text(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

int fail(const engine::Error& error) {
    std::cerr << "[Retina] " << error.describe() << "\n";
    return 1;
}

engine::RetrieverOptions retriever_options(const engine::Config& config) {
    engine::RetrieverOptions options;
    options.similarity_threshold = config.similarity_threshold;
    options.normalize = config.normalize;
    options.generation_concurrency_limit = config.generation_concurrency_limit;
    return options;
}

int run_build(const engine::Config& config, bool force) {
    auto embedder = engine::create_ollama_embedder(config.embedding_model, config.embedding_endpoint,
                                                   config.request_timeout_seconds);
    engine::IndexHandle handle(config.index_dir);

    if (!force && handle.store().exists(config.index_name)) {
        if (auto opened = handle.open(config.index_name); !opened) {
            std::cerr << "[Retina] Existing index unusable, rebuilding: " << opened.error().describe() << "\n";
            force = true;
        }
    }

    engine::Scanner scanner(config.extensions);
    std::vector<engine::ContentRef> contents;
    for (const auto& file : scanner.collect(config.content_dir)) {
        contents.push_back(engine::ContentRef::from_file(file.path));
    }
    std::cout << "[Retina] Found " << contents.size() << " files in " << config.content_dir << "\n";

    engine::Indexer indexer(handle, *embedder, config.index, config.batch_size, config.normalize);
    auto stats = indexer.build(contents, force);
    if (!stats) return fail(stats.error());

    if (auto saved = handle.save(config.index_name); !saved) return fail(saved.error());

    std::cout << to_text(stats.value()) << "\n";
    return 0;
}

int run_query(const engine::Config& config, const std::vector<std::string>& args) {
    std::string text;
    size_t k = config.top_k;
    bool generate = true;
    size_t positional = 0;
    for (const auto& arg : args) {
        if (arg == "--no-generate") {
            generate = false;
        } else if (positional == 0) {
            text = arg;
            ++positional;
        } else if (positional == 1) {
            try {
                k = std::stoul(arg);
            } catch (const std::exception&) {
                std::cerr << "[Retina] Invalid k: " << arg << "\n";
                return 1;
            }
            ++positional;
        }
    }
    if (text.empty()) {
        print_usage();
        return 1;
    }

    engine::IndexHandle handle(config.index_dir);
    if (auto opened = handle.open(config.index_name); !opened) return fail(opened.error());

    auto embedder = engine::create_ollama_embedder(config.embedding_model, config.embedding_endpoint,
                                                   config.request_timeout_seconds);
    auto generator = engine::create_ollama_generator(config.generation_model, config.generation_endpoint,
                                                     config.request_timeout_seconds);

    engine::MetricsRecorder metrics;
    engine::Retriever retriever(handle, *embedder, generator.get(), retriever_options(config));
    if (auto ready = retriever.initialize(); !ready) return fail(ready.error());
    retriever.attach_metrics(&metrics);

    std::signal(SIGINT, signal_handler);
    auto result = retriever.query(text, k, generate, &g_cancel);
    std::signal(SIGINT, SIG_DFL);
    if (!result) return fail(result.error());

    std::cout << to_text(result.value()) << "\n";

    auto destination = std::filesystem::path(config.results_dir) / engine::MetricsRecorder::default_file_name();
    if (auto exported = metrics.export_json(destination); !exported) {
        std::cerr << "[Retina] Metrics export failed: " << exported.error().describe() << "\n";
    }
    return result->success ? 0 : 1;
}

int run_status(const engine::Config& config) {
    engine::IndexHandle handle(config.index_dir);
    if (handle.store().exists(config.index_name)) {
        if (auto opened = handle.open(config.index_name); !opened) return fail(opened.error());
    }

    auto embedder = engine::create_ollama_embedder(config.embedding_model, config.embedding_endpoint,
                                                   config.request_timeout_seconds);
    engine::Retriever retriever(handle, *embedder, nullptr, retriever_options(config));
    if (auto ready = retriever.initialize(); !ready) return fail(ready.error());

    nlohmann::json status = retriever.status();
    status["index_name"] = config.index_name;
    status["saved_indexes"] = handle.list();
    std::cout << to_text(status) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    const char* env_config = std::getenv("RETINA_CONFIG");
    std::filesystem::path config_path = env_config ? env_config : "retina.json";
    auto config = engine::Config::load(config_path);

    if (command == "build") {
        bool force = !args.empty() && args[0] == "--force";
        return run_build(config, force);
    }
    if (command == "query") {
        return run_query(config, args);
    }
    if (command == "list") {
        engine::IndexHandle handle(config.index_dir);
        for (const auto& name : handle.list()) std::cout << name << "\n";
        return 0;
    }
    if (command == "delete") {
        if (args.empty()) {
            print_usage();
            return 1;
        }
        engine::IndexHandle handle(config.index_dir);
        if (auto removed = handle.remove(args[0]); !removed) return fail(removed.error());
        return 0;
    }
    if (command == "status") {
        return run_status(config);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
