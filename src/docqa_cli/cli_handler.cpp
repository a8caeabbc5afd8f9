#include "docqa_cli/cli_handler.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>

#include "docqa_core/cache/kv_cache.hpp"
#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/conversation/conversation_service.hpp"
#include "docqa_core/core/resource_registry.hpp"
#include "docqa_core/db/chunk_store.hpp"
#include "docqa_core/db/conversation_store.hpp"
#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/services/ingestion_pipeline.hpp"
#include "docqa_core/services/search_service.hpp"
#include "docqa_core/versioning/version_tracker.hpp"

namespace docqa_cli {

namespace {

docqa_core::ResourceOptions resource_options(const Config& config) {
    docqa_core::ResourceOptions options;
    options.index_dir = config.embeddings_dir;
    options.index_name = config.index_name;
    options.index.dimension = static_cast<size_t>(config.vector_dimension);
    options.index.type = config.vector_index_type();
    options.index.ivf_nlist = config.ivf_nlist;
    options.index.ivf_nprobe = config.ivf_nprobe;
    options.ollama_url = config.ollama_url;
    options.embedding_model = config.embedding_model;
    options.embedder.cache_prefix = config.cache_key_prefix;
    options.embedder.cache_ttl = std::chrono::seconds(config.cache_ttl_embedding_seconds);
    return options;
}

docqa_core::ExtractorOptions extractor_options(const Config& config) {
    docqa_core::ExtractorOptions options;
    options.max_file_size_bytes = static_cast<std::uintmax_t>(config.max_file_size_mb) * 1024 * 1024;
    options.text_encodings = config.encoding_ladder();
    return options;
}

docqa_core::ConversationOptions conversation_options(const Config& config) {
    docqa_core::ConversationOptions options;
    options.generation.max_tokens = config.llm_max_tokens;
    options.generation.temperature = config.llm_temperature;
    options.generation.top_p = config.llm_top_p;
    options.generation.frequency_penalty = config.llm_frequency_penalty;
    options.generation.presence_penalty = config.llm_presence_penalty;
    options.generation.timeout = std::chrono::seconds(config.llm_timeout_seconds);
    options.max_retries = config.max_retries;
    options.context_max_tokens = config.context_max_tokens;
    options.intent_confidence_threshold = static_cast<float>(config.intent_confidence_threshold);
    options.enable_escalation = config.enable_escalation;
    options.hr_emails = config.hr_emails;
    options.cache_enabled = config.cache_enabled;
    options.cache_prefix = config.cache_key_prefix;
    options.response_ttl = std::chrono::seconds(config.cache_ttl_response_seconds);
    return options;
}

}  // namespace

struct Runtime {
    explicit Runtime(const Config& config)
        : db(config.database_path, config.database_key, std::max(2, config.num_workers + 1)),
          chunk_store(db),
          cache(db),
          conversation_store(db),
          resources(resource_options(config), chunk_store, config.cache_enabled ? &cache : nullptr),
          extractors(extractor_options(config)),
          chunker({config.chunk_size, config.chunk_overlap, config.include_overlap_in_chunk}),
          versions(config.version_file, config.backup_dir),
          ingestion(extractors, chunker, resources.embedder(), chunk_store, resources.index(), &versions,
                    {config.processed_dir, static_cast<size_t>(config.num_workers),
                     static_cast<size_t>(config.ingest_batch_size)}),
          search(resources.embedder(), resources.index(), chunk_store,
                 {static_cast<float>(config.similarity_threshold), config.max_vector_search_top_k}),
          context(search, resources.tokenizer(),
                  {static_cast<size_t>(config.min_viable_chunk_chars), config.policy_keywords,
                   config.context_retry_attempts, std::chrono::milliseconds(config.context_retry_delay_ms)}),
          chat(config.llm_api_url, config.llm_api_key, config.llm_model),
          health(chat, std::chrono::seconds(config.health_cache_seconds)),
          history(conversation_store, static_cast<size_t>(config.max_history_messages)),
          language(config.supported_languages),
          intents(static_cast<float>(config.intent_confidence_threshold)),
          prompts({config.system_prompt, static_cast<size_t>(config.history_turns_in_prompt),
                   config.enable_escalation}),
          conversation(chat, health, context, history, language, intents, entities, prompts,
                       config.cache_enabled ? &cache : nullptr, conversation_options(config)) {
        conversation.set_file_refresher(
            [this](const std::filesystem::path& path) { ingestion.process_file(path, false); });
        if (config.auto_reindex_on_update) {
            versions.set_reindex_callback([this](const std::filesystem::path& path) {
                return ingestion.process_file(path, true).status == docqa_core::FileIngestStatus::Processed;
            });
        }
    }

    docqa_core::DatabaseManager db;
    docqa_core::ChunkStore chunk_store;
    docqa_core::SqliteKeyValueCache cache;
    docqa_core::SqliteConversationStore conversation_store;
    docqa_core::ResourceRegistry resources;
    docqa_core::ContentExtractorFactory extractors;
    docqa_core::TextChunker chunker;
    docqa_core::VersionTracker versions;
    docqa_core::IngestionPipeline ingestion;
    docqa_core::SearchService search;
    docqa_core::ContextAssembler context;
    docqa_core::HttpChatClient chat;
    docqa_core::LlmHealthMonitor health;
    docqa_core::HistoryManager history;
    docqa_core::LanguageDetector language;
    docqa_core::IntentClassifier intents;
    docqa_core::EntityExtractor entities;
    docqa_core::PromptBuilder prompts;
    docqa_core::ConversationService conversation;
};

CliHandler::CliHandler(Config config) : config_(std::move(config)) {}

CliHandler::~CliHandler() = default;

Runtime& CliHandler::runtime() {
    if (!runtime_) {
        runtime_ = std::make_unique<Runtime>(config_);
    }
    return *runtime_;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
    } else if (command == "ask" || command == "a") {
        options.command = Command::Ask;
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else if (command == "versions" || command == "v") {
        options.command = Command::Versions;
    } else if (command == "backup" || command == "b") {
        options.command = Command::Backup;
    } else if (command == "restore" || command == "r") {
        options.command = Command::Restore;
    } else if (command == "warm-up" || command == "w") {
        options.command = Command::WarmUp;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--force") {
            options.force = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else if (flag == "--dir" || flag == "-d") {
            options.directory = value;
        } else if (flag == "--file" || flag == "-f") {
            if (options.command == Command::Ask) {
                options.attached_files.push_back(value);
            } else {
                options.file_path = value;
            }
        } else if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--device") {
            options.device_id = value;
        } else if (flag == "--chat") {
            options.chat_id = value;
        } else if (flag == "--top-k" || flag == "-k") {
            try {
                options.top_k = std::stoi(value);
            } catch (const std::exception&) {
                throw CliError("--top-k expects a number, got: " + value);
            }
        } else if (flag == "--backup") {
            options.backup_path = value;
        } else if (flag == "--target") {
            options.target_path = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    switch (options.command) {
        case Command::Ask:
        case Command::Search:
            if (options.query.empty()) {
                throw CliError(command + " requires a query. Usage: " + command + " --query <query>");
            }
            break;
        case Command::Versions:
        case Command::Backup:
            if (options.file_path.empty()) {
                throw CliError(command + " requires a file path. Usage: " + command + " --file <path>");
            }
            break;
        case Command::Restore:
            if (options.backup_path.empty() || options.target_path.empty()) {
                throw CliError("restore requires a backup and a target. Usage: restore --backup <path> --target <path>");
            }
            break;
        case Command::Ingest:
            if (!options.directory.empty() && !options.file_path.empty()) {
                throw CliError("ingest takes either --dir or --file, not both");
            }
            break;
        default:
            break;
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    try {
        switch (options.command) {
            case Command::Ingest:
                return handle_ingest_command(options);
            case Command::Ask:
                return handle_ask_command(options);
            case Command::Search:
                return handle_search_command(options);
            case Command::Versions:
                return handle_versions_command(options);
            case Command::Backup:
                return handle_backup_command(options);
            case Command::Restore:
                return handle_restore_command(options);
            case Command::WarmUp:
                return handle_warm_up_command(options);
            case Command::Help:
                return handle_help_command(options);
        }
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
    return 0;
}

int CliHandler::handle_ingest_command(const CliOptions& options) {
    auto& rt = runtime();

    if (!options.file_path.empty()) {
        std::cout << "Ingesting file: " << options.file_path << std::endl;
        const auto result = rt.ingestion.process_file(options.file_path, options.force);
        std::cout << "  " << result.path.filename().string() << ": " << docqa_core::to_string(result.status)
                  << " (" << result.chunks << " chunks, " << result.embeddings << " embeddings)" << std::endl;
        if (result.status == docqa_core::FileIngestStatus::Failed) {
            print_error(result.error);
            return 1;
        }
        return 0;
    }

    const std::string directory = options.directory.empty() ? config_.raw_dir : options.directory;
    std::cout << "Ingesting directory: " << directory << (options.force ? " (forced)" : "") << std::endl;
    const auto summary = rt.ingestion.process_directory(directory, options.force);

    for (const auto& file : summary.files) {
        std::cout << "  " << file.path.filename().string() << ": " << docqa_core::to_string(file.status);
        if (file.status == docqa_core::FileIngestStatus::Processed) {
            std::cout << " (" << file.chunks << " chunks, " << file.embeddings << " embeddings";
            if (file.retired_chunks > 0) {
                std::cout << ", " << file.retired_chunks << " retired";
            }
            std::cout << ")";
        } else if (!file.error.empty()) {
            std::cout << " - " << file.error;
        }
        std::cout << std::endl;
    }
    std::cout << "\nProcessed: " << summary.processed_count << ", skipped: " << summary.skipped_count
              << ", failed: " << summary.failed_count << std::endl;
    std::cout << "Index now holds " << rt.resources.index().count() << " vectors" << std::endl;
    return summary.failed_count == 0 ? 0 : 1;
}

int CliHandler::handle_ask_command(const CliOptions& options) {
    auto& rt = runtime();

    docqa_core::TurnRequest request;
    request.query = options.query;
    request.device_id = options.device_id;
    request.chat_id = options.chat_id.empty() ? options.device_id : options.chat_id;
    for (const auto& file : options.attached_files) {
        request.files.push_back({std::filesystem::path(file).filename().string(), file});
    }

    const auto result = rt.conversation.handle(request);

    std::cout << "\n" << result.content << "\n" << std::endl;
    if (!result.sources.empty()) {
        std::cout << "Sources:" << std::endl;
        for (size_t i = 0; i < result.sources.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << result.sources[i].title << " (Relevance: " << std::fixed
                      << std::setprecision(2) << result.sources[i].score << ")" << std::endl;
        }
    }
    std::cout << "\nLanguage: " << result.language << " | Intent: " << result.intent << " ("
              << std::fixed << std::setprecision(2) << result.intent_confidence << ")"
              << " | Time: " << std::setprecision(2) << result.response_time << "s"
              << (result.cached ? " | cached" : "") << (result.escalated ? " | escalated" : "") << std::endl;

    if (result.error) {
        print_error(*result.error);
        return 1;
    }
    return 0;
}

int CliHandler::handle_search_command(const CliOptions& options) {
    auto& rt = runtime();
    const int top_k = options.top_k > 0 ? options.top_k : config_.max_context_documents;
    std::cout << "Search for: " << options.query << " (top_k: " << top_k << ")" << std::endl;

    const std::string key = docqa_core::make_cache_key(config_.cache_key_prefix, docqa_core::CacheKind::Query,
                                                       options.query + "#" + std::to_string(top_k));
    nlohmann::json hits;
    bool cached = false;
    if (config_.cache_enabled) {
        try {
            if (auto value = rt.cache.get(key)) {
                hits = nlohmann::json::parse(*value);
                cached = true;
            }
        } catch (const std::exception& e) {
            std::cerr << "[CliHandler] Warning: cache read failed: " << e.what() << std::endl;
        }
    }

    if (!cached) {
        hits = nlohmann::json::array();
        for (const auto& result : rt.search.search(options.query, top_k)) {
            hits.push_back({{"title", result.chunk.title},
                            {"source_file", result.chunk.source_file},
                            {"score", result.score},
                            {"content", result.chunk.content}});
        }
        if (config_.cache_enabled) {
            try {
                rt.cache.set(key, hits.dump(), std::chrono::seconds(config_.cache_ttl_query_seconds));
            } catch (const std::exception& e) {
                std::cerr << "[CliHandler] Warning: cache write failed: " << e.what() << std::endl;
            }
        }
    }

    std::cout << "\n=== Search Results" << (cached ? " (cached)" : "") << " ===" << std::endl;
    if (hits.empty()) {
        std::cout << "No results found." << std::endl;
        return 0;
    }
    for (const auto& hit : hits) {
        const std::string content = hit["content"].get<std::string>();
        std::cout << "  * " << hit["title"].get<std::string>() << " (" << hit["source_file"].get<std::string>()
                  << ") | Score: " << std::fixed << std::setprecision(3) << hit["score"].get<float>() << std::endl;
        std::cout << "    " << content.substr(0, 100) << (content.size() > 100 ? "..." : "") << std::endl;
    }
    return 0;
}

int CliHandler::handle_versions_command(const CliOptions& options) {
    auto& rt = runtime();
    const std::string file_name = std::filesystem::path(options.file_path).filename().string();
    const auto records = rt.versions.history(file_name);
    if (records.empty()) {
        std::cout << "No versions recorded for " << file_name << std::endl;
        return 0;
    }
    std::cout << "Versions of " << file_name << " (oldest first):" << std::endl;
    for (const auto& record : records) {
        std::cout << "  " << record.last_modified << "  " << record.content_hash.substr(0, 12) << "  "
                  << record.size << " bytes  " << record.metadata.dump() << std::endl;
    }
    const bool stale = rt.versions.needs_reindex(options.file_path);
    std::cout << (stale ? "Current file differs from the indexed version." : "Index is up to date.") << std::endl;
    return 0;
}

int CliHandler::handle_backup_command(const CliOptions& options) {
    auto& rt = runtime();
    const auto backup_path = rt.versions.backup(options.file_path);
    std::cout << "Backup written to " << backup_path << std::endl;
    const size_t removed = rt.versions.cleanup_old_versions(static_cast<size_t>(config_.max_document_versions));
    if (removed > 0) {
        std::cout << "Removed " << removed << " old backups" << std::endl;
    }
    return 0;
}

int CliHandler::handle_restore_command(const CliOptions& options) {
    auto& rt = runtime();
    const bool reindexed = rt.versions.restore(options.backup_path, options.target_path);
    std::cout << "Restored " << options.backup_path << " to " << options.target_path << std::endl;
    if (!reindexed) {
        print_error("restored file could not be re-ingested");
        return 1;
    }
    return 0;
}

int CliHandler::handle_warm_up_command(const CliOptions& options) {
    (void)options;
    auto& rt = runtime();
    rt.resources.warm_up();
    try {
        std::cout << "Expired cache entries removed: " << rt.cache.purge_expired() << std::endl;
    } catch (const docqa_core::CacheError& e) {
        std::cerr << "[CliHandler] Warning: cache purge failed: " << e.what() << std::endl;
    }
    const bool llm_ok = rt.health.is_operational(true);
    std::cout << "Index: " << rt.resources.index().count() << " vectors ("
              << docqa_core::to_string(rt.resources.index().options().type) << ")" << std::endl;
    std::cout << "Chunks stored: " << rt.chunk_store.count() << std::endl;
    std::cout << "Language model: " << (llm_ok ? "operational" : "unavailable") << std::endl;
    return llm_ok ? 0 : 1;
}

int CliHandler::handle_help_command(const CliOptions& options) {
    (void)options;
    print_help();
    return 0;
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
DocQA - Question answering over your document collection

Usage: docqa <command> [options] [--config, -c <path>]

Document Commands:
  ingest, i     Ingest documents into the index
    --dir, -d <path>     Directory to ingest (default: raw_dir from config)
    --file, -f <path>    Ingest a single file instead
    --force              Re-ingest even if already processed

  versions, v   Show recorded versions of a document
    --file, -f <path>    Document to inspect

  backup, b     Copy a document to the backup directory
    --file, -f <path>    Document to back up

  restore, r    Restore a backup and re-ingest it
    --backup <path>      Backup file
    --target <path>      Where to restore it

Question Commands:
  ask, a        Ask a question
    --query, -q <text>   The question
    --device <id>        Conversation owner (default: cli)
    --chat <id>          Chat id (default: the device id)
    --file, -f <path>    Attach a document; may repeat

  search, s     Show the chunks retrieved for a query
    --query, -q <text>   Search query
    --top-k, -k <num>    Number of results (default: max_context_documents)

Other Commands:
  warm-up, w    Load the index and models, probe the services
  help, h       Show this help message

Examples:
  docqa ingest --dir ./data/raw
  docqa ask --query "How many sick days do I get?"
  docqa search --query "remote work" --top-k 3
)" << std::endl;
}

}  // namespace docqa_cli
