#include "content_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <set>
#include <vector>

#include "internal/util/text.hpp"

namespace strata::classifier {

namespace {

constexpr std::size_t kWindowWords = 200;
constexpr double      kSingleWindowCoherence = 0.3;

constexpr uint64_t kKiB = 1024;
constexpr uint64_t kMiB = 1024 * kKiB;

struct DomainKeywords {
  std::string_view              domain;
  std::vector<std::string_view> keywords;
};

// Sorted by domain so ties resolve to the lexicographically smaller name.
const std::vector<DomainKeywords>& KeywordTable() {
  static const std::vector<DomainKeywords> table = {
      {"history", {"historical", "ancient", "medieval", "century", "civilization", "culture"}},
      {"literature", {"novel", "story", "character", "plot", "literary", "fiction", "poetry"}},
      {"mathematics", {"mathematics", "equation", "theorem", "proof", "number", "formula", "calculation"}},
      {"medicine", {"medical", "health", "treatment", "patient", "clinical", "disease", "therapy"}},
      {"philosophy", {"philosophy", "ethics", "metaphysics", "logic", "consciousness", "existence"}},
      {"religion", {"god", "spiritual", "faith", "prayer", "divine", "sacred", "bible", "quran"}},
      {"science", {"research", "study", "analysis", "hypothesis", "experiment", "data", "theory"}},
      {"technology", {"technology", "software", "computer", "digital", "programming", "algorithm"}},
  };
  return table;
}

const std::set<std::string_view>& Stopwords() {
  static const std::set<std::string_view> words = {
      "about", "above", "after", "again", "against", "also",  "because", "been",  "before", "being",
      "below", "between", "both", "could", "does",   "doing", "down",    "during", "each",  "from",
      "further", "have",  "having", "here", "into",  "itself", "just",   "more",  "most",   "only",
      "other", "over",    "same",  "should", "some", "such",  "than",    "that",  "their",  "them",
      "then",  "there",   "these", "they",  "this",  "those", "through", "under", "until",  "very",
      "were",  "what",    "when",  "where", "which", "while", "will",    "with",  "would",  "your",
  };
  return words;
}

bool IsInformative(const std::string& token) {
  return token.size() > 3 && Stopwords().count(token) == 0;
}

double Clamp01(double v) {
  return std::clamp(v, 0.0, 1.0);
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (auto n : needles) {
    if (haystack.find(n) != std::string_view::npos) return true;
  }
  return false;
}

// Coefficient of variation of words-per-sentence; 0 with fewer than two sentences.
double SentenceLengthCv(std::string_view text) {
  std::vector<double> lengths;
  std::size_t         start = 0;
  for (std::size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == '.' || text[i] == '!' || text[i] == '?') {
      const auto words = util::CountWords(text.substr(start, i - start));
      if (words > 0) lengths.push_back(static_cast<double>(words));
      start = i + 1;
    }
  }
  if (lengths.size() < 2) return 0.0;

  double mean = 0.0;
  for (double l : lengths) mean += l;
  mean /= static_cast<double>(lengths.size());
  if (mean <= 0.0) return 0.0;

  double var = 0.0;
  for (double l : lengths) var += (l - mean) * (l - mean);
  var /= static_cast<double>(lengths.size());
  return std::sqrt(var) / mean;
}

double SemanticComplexity(std::string_view text, const std::vector<std::string>& tokens) {
  if (tokens.empty()) return 0.0;

  std::set<std::string_view> distinct;
  std::size_t                chars = 0;
  for (const auto& t : tokens) {
    distinct.insert(t);
    chars += t.size();
  }
  const double n       = static_cast<double>(tokens.size());
  const double ttr     = static_cast<double>(distinct.size()) / n;
  const double cv      = std::min(1.0, SentenceLengthCv(text));
  const double avg_len = std::min(1.0, (static_cast<double>(chars) / n) / 10.0);
  return Clamp01(0.4 * ttr + 0.3 * cv + 0.3 * avg_len);
}

double TopicCoherence(const std::vector<std::string>& tokens) {
  std::vector<std::set<std::string_view>> windows;
  for (std::size_t start = 0; start < tokens.size(); start += kWindowWords) {
    std::set<std::string_view> window;
    const auto                 end = std::min(tokens.size(), start + kWindowWords);
    for (std::size_t i = start; i < end; ++i) {
      if (IsInformative(tokens[i])) window.insert(tokens[i]);
    }
    windows.push_back(std::move(window));
  }
  if (windows.size() < 2) return kSingleWindowCoherence;

  double sum = 0.0;
  for (std::size_t i = 1; i < windows.size(); ++i) {
    const auto& a = windows[i - 1];
    const auto& b = windows[i];
    std::size_t inter = 0;
    for (const auto& t : a) inter += b.count(t);
    const std::size_t uni = a.size() + b.size() - inter;
    sum += uni == 0 ? 0.0 : static_cast<double>(inter) / static_cast<double>(uni);
  }
  return Clamp01(sum / static_cast<double>(windows.size() - 1));
}

double InformationDensity(const std::vector<std::string>& tokens) {
  if (tokens.empty()) return 0.0;
  std::set<std::string_view> informative;
  for (const auto& t : tokens) {
    if (IsInformative(t)) informative.insert(t);
  }
  return Clamp01(static_cast<double>(informative.size()) / static_cast<double>(tokens.size()));
}

bool HasStructure(std::string_view text, const std::vector<std::string>& tokens) {
  std::size_t line_start = 0;
  while (line_start < text.size()) {
    auto line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos) line_end = text.size();
    const auto line = util::Trim(text.substr(line_start, line_end - line_start));
    if (!line.empty()) {
      if (line.front() == '#') return true;
      std::size_t digits = 0;
      while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) ++digits;
      if (digits > 0 && digits < line.size() && (line[digits] == '.' || line[digits] == ')')) return true;
    }
    line_start = line_end + 1;
  }

  for (const auto& t : tokens) {
    if (t == "chapter" || t == "section" || t == "table" || t == "list") return true;
  }
  return false;
}

} // namespace

ContentClassifier::ContentClassifier(const strata::runtime::config::ClassifierConfig& config)
    : default_domain_prior_(config.default_domain_prior()), default_content_type_prior_(config.default_content_type_prior()) {
  for (const auto& p : config.domain_priors()) {
    domain_priors_[p.domain()] = p.query_prior();
  }
  for (const auto& p : config.content_type_priors()) {
    content_type_priors_[p.content_type()] = p.access_prior();
  }
}

double ContentClassifier::DomainPrior(const std::string& domain) const {
  const auto it = domain_priors_.find(domain);
  return it == domain_priors_.end() ? default_domain_prior_ : it->second;
}

double ContentClassifier::ContentTypePrior(const std::string& content_type) const {
  const auto it = content_type_priors_.find(content_type);
  return it == content_type_priors_.end() ? default_content_type_prior_ : it->second;
}

std::string ContentClassifier::ResolveDomain(std::string_view text, std::string_view locator) {
  const auto lowered_text    = util::ToLower(text);
  const auto lowered_locator = util::ToLower(locator);

  std::string_view best;
  std::size_t      best_hits = 0;
  for (const auto& entry : KeywordTable()) {
    std::size_t hits = 0;
    for (auto kw : entry.keywords) {
      if (lowered_text.find(kw) != std::string::npos || lowered_locator.find(kw) != std::string::npos) {
        ++hits;
      }
    }
    // strict comparison keeps the earlier (smaller) domain on ties
    if (hits > best_hits) {
      best      = entry.domain;
      best_hits = hits;
    }
  }
  return best_hits == 0 ? std::string("general") : std::string(best);
}

std::string ContentClassifier::ResolveContentType(std::string_view locator, uint64_t size) {
  const auto l = util::ToLower(locator);
  if (ContainsAny(l, {"book", "ebook", "gutenberg"})) return "book";
  if (ContainsAny(l, {"paper", "journal", "arxiv", "doi"})) return "academic_paper";
  if (ContainsAny(l, {"wiki", "encyclopedia"})) return "reference";

  if (size > 10 * kMiB) return "book";
  if (size > kMiB) return "large_document";
  if (size > 100 * kKiB) return "medium_document";
  return "small_document";
}

Classification ContentClassifier::Classify(const ClassifierInput& input) const {
  Classification out;
  out.domain = input.declared_domain.empty() ? ResolveDomain(input.text, input.source_locator)
                                             : util::ToLower(input.declared_domain);
  out.content_type = input.declared_content_type.empty()
                         ? ResolveContentType(input.source_locator, input.estimated_size)
                         : util::ToLower(input.declared_content_type);

  const auto tokens = util::Tokenize(input.text);

  const double length    = std::min(1.0, static_cast<double>(input.text.size()) / 10000.0);
  const double structure = HasStructure(input.text, tokens) ? 1.0 : 0.3;
  const double reference = ContainsAny(util::ToLower(input.text), {"http", "www", "doi", "isbn"}) ? 1.0 : 0.5;
  const double factors   = (length + structure + reference + DomainPrior(out.domain)) / 4.0;

  auto& profile = out.profile;
  profile.set_semantic_complexity(SemanticComplexity(input.text, tokens));
  profile.set_topic_coherence(TopicCoherence(tokens));
  profile.set_information_density(InformationDensity(tokens));
  profile.set_query_potential(Clamp01(0.8 * factors + 0.2 * ContentTypePrior(out.content_type)));
  return out;
}

} // namespace strata::classifier
