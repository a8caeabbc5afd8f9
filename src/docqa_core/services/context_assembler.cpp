#include "docqa_core/services/context_assembler.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace docqa_core {

namespace {

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

}  // namespace

PolicyKeywords default_policy_keywords() {
  return {
      {"termination", {"termination", "firing", "layoff", "severance", "dismissal"}},
      {"leave", {"leave", "vacation", "time off", "sick", "absence", "pto"}},
      {"dress code", {"dress", "attire", "clothing", "appearance", "uniform"}},
      {"referral", {"referral", "refer", "recommendation", "recommend"}},
      {"work from home", {"work from home", "wfh", "remote", "telework", "telecommute"}},
  };
}

ContextAssembler::ContextAssembler(SearchService& search, const Tokenizer& tokenizer, ContextOptions options)
    : search_(search), tokenizer_(tokenizer), options_(std::move(options)) {}

int ContextAssembler::top_k_for(int max_tokens) {
  return std::min(10, std::max(3, max_tokens / 300));
}

size_t ContextAssembler::char_budget(int max_tokens) const {
  if (max_tokens <= 0) return 0;
  return static_cast<size_t>(max_tokens) * static_cast<size_t>(estimate_chars_per_token(tokenizer_));
}

std::string ContextAssembler::rewrite_query(const std::string& query) const {
  const std::string lowered = lower(query);
  for (const auto& [topic, keywords] : options_.policy_keywords) {
    for (const auto& keyword : keywords) {
      if (!keyword.empty() && lowered.find(lower(keyword)) != std::string::npos) {
        std::cout << "[ContextAssembler] Enhanced query with policy type '" << topic << "'" << std::endl;
        return topic + " policy: " + query;
      }
    }
  }
  return query;
}

size_t ContextAssembler::sentence_cutoff(const std::string& text, size_t limit) {
  limit = std::min(limit, text.size());
  if (limit == 0) return 0;
  size_t end = text.rfind('.', limit - 1);
  if (end == std::string::npos) {
    end = text.rfind(' ', limit - 1);
  }
  return end == std::string::npos ? limit : end + 1;
}

ContextBundle ContextAssembler::build(const std::string& query, int max_tokens,
                                      const std::vector<AttachedFile>& files) const {
  const auto started = std::chrono::steady_clock::now();
  const int top_k = top_k_for(max_tokens);
  const size_t budget = char_budget(max_tokens);

  std::vector<std::string> prioritized;
  for (const auto& file : files) {
    if (!file.file_name.empty()) {
      prioritized.push_back(file.file_name);
    } else if (!file.path.empty()) {
      prioritized.push_back(file.path);
    }
  }

  const std::string enhanced = rewrite_query(query);
  std::vector<RetrievalResult> results;
  const int attempts = std::max(1, options_.retry_attempts);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      results = search_.search(enhanced, top_k, prioritized);
      break;
    } catch (const std::exception& e) {
      std::cerr << "[ContextAssembler] Warning: search attempt " << attempt << "/" << attempts
                << " failed: " << e.what() << std::endl;
      if (attempt == attempts) {
        std::cerr << "[ContextAssembler] Retrieval failed after retries" << std::endl;
        return {};
      }
      std::this_thread::sleep_for(options_.retry_delay);
    }
  }

  if (results.empty()) {
    std::cerr << "[ContextAssembler] No relevant documents found." << std::endl;
    return {};
  }
  std::stable_sort(results.begin(), results.end(),
                   [](const RetrievalResult& a, const RetrievalResult& b) { return a.score > b.score; });

  const std::string separator = SEPARATOR;
  ContextBundle bundle;
  auto add_source = [&bundle](const RetrievalResult& result) {
    const bool seen = std::any_of(bundle.sources.begin(), bundle.sources.end(), [&result](const SourceRef& s) {
      return s.title == result.chunk.title && s.source_file == result.chunk.source_file;
    });
    if (!seen) {
      bundle.sources.push_back({result.chunk.title, result.chunk.source_file, result.score});
    }
  };

  for (const auto& result : results) {
    const std::string content = trim(result.chunk.content);
    if (content.empty()) continue;

    const size_t used = bundle.context.size() + (bundle.context.empty() ? 0 : separator.size());
    const size_t remaining = used >= budget ? 0 : budget - used;

    if (content.size() > remaining) {
      if (remaining >= options_.min_viable_chars) {
        std::string truncated = trim(content.substr(0, sentence_cutoff(content, remaining)));
        if (!truncated.empty()) {
          if (!bundle.context.empty()) bundle.context += separator;
          bundle.context += truncated;
          add_source(result);
        }
      }
      break;
    }

    if (!bundle.context.empty()) bundle.context += separator;
    bundle.context += content;
    add_source(result);
  }

  const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
  std::cout << "[ContextAssembler] Built context: " << bundle.context.size() << " chars (~"
            << tokenizer_.tokenize(bundle.context).size() << " tokens) from " << bundle.sources.size()
            << " sources in " << std::fixed << std::setprecision(2) << elapsed << "s" << std::endl;
  return bundle;
}

std::string ContextAssembler::format_with_sources(const ContextBundle& bundle) {
  if (bundle.context.empty()) {
    return "";
  }
  std::ostringstream out;
  out << bundle.context << "\n\nSources:\n";
  for (size_t i = 0; i < bundle.sources.size(); ++i) {
    out << (i + 1) << ". " << bundle.sources[i].title << " (Relevance: " << std::fixed
        << std::setprecision(2) << bundle.sources[i].score << ")\n";
  }
  return out.str();
}

}  // namespace docqa_core
