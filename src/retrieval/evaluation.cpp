#include "ragvix/retrieval/evaluation.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/common/json_util.hpp"

#include <algorithm>
#include <fstream>
#include <limits>

namespace ragvix::retrieval {

namespace {

std::set<std::string> top_k(const std::vector<std::string> &retrieved, const std::size_t k) {
  const auto end = retrieved.begin() + static_cast<std::ptrdiff_t>(std::min(k, retrieved.size()));
  return std::set<std::string>(retrieved.begin(), end);
}

std::size_t overlap(const std::set<std::string> &a, const std::set<std::string> &b) {
  std::size_t count = 0;
  for (const auto &id : a) {
    if (b.contains(id)) {
      ++count;
    }
  }
  return count;
}

} // namespace

double recall_at_k(const std::vector<std::string> &retrieved,
                   const std::set<std::string> &relevant, const std::size_t k) {
  if (relevant.empty()) {
    return 0.0;
  }
  return static_cast<double>(overlap(top_k(retrieved, k), relevant)) /
         static_cast<double>(relevant.size());
}

double precision_at_k(const std::vector<std::string> &retrieved,
                      const std::set<std::string> &relevant, const std::size_t k) {
  const auto head = top_k(retrieved, k);
  if (head.empty()) {
    return 0.0;
  }
  return static_cast<double>(overlap(head, relevant)) / static_cast<double>(head.size());
}

common::Result<std::vector<Judgment>> read_judgments(const std::filesystem::path &path) {
  using R = common::Result<std::vector<Judgment>>;
  std::ifstream file(path);
  if (!file) {
    return R::failure(common::ErrorCode::IoError,
                      "unable to open judgments file: " + path.string());
  }

  std::vector<Judgment> judgments;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    const std::string trimmed = common::trim(line);
    if (trimmed.empty()) {
      continue;
    }
    const auto fields = common::json_parse_flat(trimmed);
    const auto query = fields.find("query");
    const auto relevant = fields.find("relevant");
    if (query == fields.end() || common::trim(query->second).empty() ||
        relevant == fields.end()) {
      return R::failure(common::ErrorCode::InvalidArgument,
                        path.string() + ":" + std::to_string(line_number) +
                            ": expected \"query\" and \"relevant\"");
    }
    const auto ids = common::json_parse_string_array(relevant->second);
    judgments.push_back(
        Judgment{.query = query->second,
                 .relevant_document_ids = std::set<std::string>(ids.begin(), ids.end())});
  }
  return R::success(std::move(judgments));
}

common::Result<EvaluationReport>
evaluate_rankings(const std::vector<std::vector<std::string>> &rankings,
                  const std::vector<Judgment> &judgments,
                  const std::vector<std::size_t> &k_values) {
  using R = common::Result<EvaluationReport>;
  if (rankings.size() != judgments.size()) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "got " + std::to_string(rankings.size()) + " rankings for " +
                          std::to_string(judgments.size()) + " judgments");
  }
  if (k_values.empty() ||
      std::any_of(k_values.begin(), k_values.end(), [](std::size_t k) { return k == 0; })) {
    return R::failure(common::ErrorCode::InvalidArgument, "k values must be positive");
  }

  EvaluationReport report;
  report.queries = judgments.size();
  for (const std::size_t k : k_values) {
    double recall = 0.0;
    double precision = 0.0;
    for (std::size_t i = 0; i < judgments.size(); ++i) {
      recall += recall_at_k(rankings[i], judgments[i].relevant_document_ids, k);
      precision += precision_at_k(rankings[i], judgments[i].relevant_document_ids, k);
    }
    const double n = judgments.empty() ? 1.0 : static_cast<double>(judgments.size());
    report.metrics["recall@" + std::to_string(k)] = recall / n;
    report.metrics["precision@" + std::to_string(k)] = precision / n;
  }
  return R::success(std::move(report));
}

common::Result<EvaluationReport> evaluate_retrieval(const Retriever &retriever,
                                                    const std::vector<Judgment> &judgments,
                                                    const std::vector<std::size_t> &k_values) {
  if (k_values.empty()) {
    return common::Result<EvaluationReport>::failure(common::ErrorCode::InvalidArgument,
                                                     "k values must not be empty");
  }
  const std::size_t max_k = *std::max_element(k_values.begin(), k_values.end());
  if (max_k > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return common::Result<EvaluationReport>::failure(common::ErrorCode::InvalidArgument,
                                                     "k values must not exceed INT_MAX");
  }

  std::vector<std::vector<std::string>> rankings;
  rankings.reserve(judgments.size());
  for (const auto &judgment : judgments) {
    auto results = retriever.search(judgment.query, static_cast<int>(max_k));
    if (!results.ok()) {
      return common::Result<EvaluationReport>::failure(results.status());
    }
    std::vector<std::string> ranking;
    ranking.reserve(results.value().size());
    for (const auto &result : results.value()) {
      ranking.push_back(result.document_id);
    }
    rankings.push_back(std::move(ranking));
  }
  return evaluate_rankings(rankings, judgments, k_values);
}

} // namespace ragvix::retrieval
