#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/retrieval/retriever.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ragvix::retrieval {

/// Fraction of relevant ids found among the first k retrieved ids. 0 when nothing is
/// relevant.
[[nodiscard]] double recall_at_k(const std::vector<std::string> &retrieved,
                                 const std::set<std::string> &relevant, std::size_t k);

/// Fraction of the distinct ids among the first k retrieved that are relevant.
[[nodiscard]] double precision_at_k(const std::vector<std::string> &retrieved,
                                    const std::set<std::string> &relevant, std::size_t k);

struct Judgment {
  std::string query;
  std::set<std::string> relevant_document_ids;
};

struct EvaluationReport {
  std::size_t queries = 0;
  /// "recall@k" / "precision@k" averaged over all judgments.
  std::map<std::string, double> metrics;
};

/// Reads one `{"query": "...", "relevant": ["doc", ...]}` object per line.
[[nodiscard]] common::Result<std::vector<Judgment>>
read_judgments(const std::filesystem::path &path);

/// Averages recall and precision for precomputed rankings; rankings[i] holds the
/// document ids retrieved for judgments[i].
[[nodiscard]] common::Result<EvaluationReport>
evaluate_rankings(const std::vector<std::vector<std::string>> &rankings,
                  const std::vector<Judgment> &judgments, const std::vector<std::size_t> &k_values);

/// Runs every judgment's query through the retriever with k = max(k_values).
[[nodiscard]] common::Result<EvaluationReport>
evaluate_retrieval(const Retriever &retriever, const std::vector<Judgment> &judgments,
                   const std::vector<std::size_t> &k_values = {1, 3, 5, 10});

} // namespace ragvix::retrieval
