#include "internal/classifier/content_classifier.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "support/test_support.hpp"

namespace {

using strata::classifier::ClassifierInput;
using strata::classifier::ContentClassifier;

constexpr uint64_t kKiB = 1024;
constexpr uint64_t kMiB = 1024 * kKiB;

ContentClassifier MakeClassifier() {
  return ContentClassifier(strata::testing::DefaultConfig().classifier());
}

void TestDomainResolvedByKeywordVotes() {
  assert(ContentClassifier::ResolveDomain("The algorithm runs on a computer", "") == "technology");
  assert(ContentClassifier::ResolveDomain("plain words only", "https://example.com/medical/health") == "medicine");
  assert(ContentClassifier::ResolveDomain("zzz qqq", "https://example.com/x") == "general");
}

void TestDomainTiesPickSmallerName() {
  // one literature hit, one mathematics hit
  assert(ContentClassifier::ResolveDomain("a novel theorem", "") == "literature");
}

void TestContentTypeFromLocatorThenSize() {
  assert(ContentClassifier::ResolveContentType("https://www.gutenberg.org/files/1", 0) == "book");
  assert(ContentClassifier::ResolveContentType("https://arxiv.org/abs/2101.1", 0) == "academic_paper");
  assert(ContentClassifier::ResolveContentType("https://en.wikipedia.org/wiki/Ethics", 0) == "reference");
  assert(ContentClassifier::ResolveContentType("https://example.com/a", 11 * kMiB) == "book");
  assert(ContentClassifier::ResolveContentType("https://example.com/a", 2 * kMiB) == "large_document");
  assert(ContentClassifier::ResolveContentType("https://example.com/a", 200 * kKiB) == "medium_document");
  assert(ContentClassifier::ResolveContentType("https://example.com/a", 10 * kKiB) == "small_document");
}

void TestDeclaredValuesAreLowerCased() {
  const auto classifier = MakeClassifier();

  ClassifierInput input;
  input.text                  = "Some text about nothing in particular.";
  input.declared_domain       = "Science";
  input.declared_content_type = "Book";
  input.source_locator        = "https://example.com/a";

  const auto out = classifier.Classify(input);
  assert(out.domain == "science");
  assert(out.content_type == "book");
  assert(classifier.DomainPrior("science") == 1.0);
  assert(classifier.DomainPrior("cooking") == 0.5);
  assert(classifier.ContentTypePrior("academic_paper") == 0.9);
}

void TestScoresStayInUnitRange() {
  const auto classifier = MakeClassifier();

  ClassifierInput input;
  input.text           = strata::testing::RepetitiveText(400);
  input.source_locator = "https://example.com/report";
  input.estimated_size = input.text.size();

  const auto p = classifier.Classify(input).profile;
  for (double v : {p.semantic_complexity(), p.topic_coherence(), p.information_density(), p.query_potential()}) {
    assert(v >= 0.0 && v <= 1.0);
  }
  // identical windows share every informative token
  assert(p.topic_coherence() > 0.9);
  assert(p.information_density() < 0.2);
}

void TestSingleWindowCoherenceIsFixed() {
  const auto classifier = MakeClassifier();

  ClassifierInput input;
  input.text = "Short note with few words.";
  assert(classifier.Classify(input).profile.topic_coherence() == 0.3);
}

void TestDensityCountsDistinctInformativeTokens() {
  const auto classifier = MakeClassifier();

  ClassifierInput dense;
  dense.text = "alpha bravo charlie delta";
  assert(classifier.Classify(dense).profile.information_density() == 1.0);

  ClassifierInput sparse;
  sparse.text = "the the the the";
  assert(classifier.Classify(sparse).profile.information_density() == 0.0);
}

void TestStructureAndReferencesRaiseQueryPotential() {
  const auto classifier = MakeClassifier();

  ClassifierInput plain;
  plain.text            = "Overview\nThe body of the note.";
  plain.declared_domain = "general";

  ClassifierInput rich = plain;
  rich.text            = "# Overview\nThe body of the note. See https://example.org.";

  const double plain_qp = classifier.Classify(plain).profile.query_potential();
  const double rich_qp  = classifier.Classify(rich).profile.query_potential();
  assert(rich_qp > plain_qp);
}

void TestClassifyIsDeterministic() {
  const auto classifier = MakeClassifier();

  ClassifierInput input;
  input.text           = "Consciousness and existence. Ethics of logic! Metaphysics? A long treatise follows here.";
  input.source_locator = "https://example.com/philosophy/essay";
  input.estimated_size = 120 * kKiB;

  const auto a = classifier.Classify(input);
  const auto b = classifier.Classify(input);
  assert(a.domain == b.domain);
  assert(a.content_type == b.content_type);
  assert(a.profile.SerializeAsString() == b.profile.SerializeAsString());
  assert(a.domain == "philosophy");
  assert(a.content_type == "medium_document");
}

} // namespace

int main() {
  TestDomainResolvedByKeywordVotes();
  TestDomainTiesPickSmallerName();
  TestContentTypeFromLocatorThenSize();
  TestDeclaredValuesAreLowerCased();
  TestScoresStayInUnitRange();
  TestSingleWindowCoherenceIsFixed();
  TestDensityCountsDistinctInformativeTokens();
  TestStructureAndReferencesRaiseQueryPotential();
  TestClassifyIsDeterministic();

  std::cout << "strata_unit_classifier: pass\n";
  return 0;
}
