#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "strata/engine/v1.hpp"

namespace strata::classifier {

struct ClassifierInput {
  std::string_view text;
  std::string      declared_domain;
  std::string      declared_content_type;
  uint64_t         estimated_size = 0;
  std::string      source_locator;
};

struct Classification {
  strata::engine::v1::ContentProfile profile;
  std::string                        domain;
  std::string                        content_type;
};

/*
  Scores content for placement.

  Pure and deterministic: no I/O, no clock, ordered containers only.
  Prior tables are copied at construction; a shared instance may be
  used from any thread.
*/
class ContentClassifier {
 public:
  explicit ContentClassifier(const strata::runtime::config::ClassifierConfig& config);

  Classification Classify(const ClassifierInput& input) const;

  // Keyword vote over text and locator; "general" when nothing matches.
  static std::string ResolveDomain(std::string_view text, std::string_view locator);

  static std::string ResolveContentType(std::string_view locator, uint64_t size);

  double DomainPrior(const std::string& domain) const;
  double ContentTypePrior(const std::string& content_type) const;

 private:
  std::map<std::string, double> domain_priors_;
  std::map<std::string, double> content_type_priors_;
  double                        default_domain_prior_;
  double                        default_content_type_prior_;
};

} // namespace strata::classifier
