#include "ragvix/config/config.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/common/toml.hpp"
#include "ragvix/corpus/chunker.hpp"
#include "ragvix/index/vector_index.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace ragvix::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".ragvix";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

constexpr std::array<const char *, 18> KNOWN_KEYS = {
    "chunking.window_size",
    "chunking.overlap",
    "chunking.unit",
    "embedding.provider",
    "embedding.model_id",
    "embedding.batch_size",
    "embedding.dimensions",
    "embedding.endpoint",
    "embedding.api_key",
    "embedding.timeout_ms",
    "index.location",
    "index.distance_metric",
    "index.on_duplicate",
    "index.allow_empty",
    "retrieval.max_chunks_per_document",
    "retrieval.candidate_multiplier",
    "retrieval.default_k",
    "observability.backend",
};

bool is_known_key(const std::string &key) {
  for (const char *known : KNOWN_KEYS) {
    if (key == known) {
      return true;
    }
  }
  return false;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = env_value("RAGVIX_CONFIG_PATH"); env != nullptr) {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

// An override naming a directory (existing, or spelled with a trailing separator) holds
// config.toml; anything else names the file itself.
bool names_directory(const std::filesystem::path &path) {
  std::error_code ec;
  return path.filename().empty() || std::filesystem::is_directory(path, ec);
}

// .env values: double quotes decode \n and \t, single quotes are literal.
std::string unquote_env_value(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() < 2 || value.front() != value.back() ||
      (value.front() != '"' && value.front() != '\'')) {
    return value;
  }
  const std::string body = value.substr(1, value.size() - 2);
  if (value.front() == '\'') {
    return body;
  }
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 == body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char next = body[++i];
    out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
  }
  return out;
}

bool is_env_name(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](const unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '_';
  });
}

/// `KEY=value` or `export KEY=value`; comments, blanks and malformed lines yield nullopt.
std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string &line) {
  std::string text = common::trim(line);
  if (text.empty() || text.front() == '#') {
    return std::nullopt;
  }
  if (common::starts_with(text, "export ")) {
    text = common::trim(text.substr(7));
  }
  const auto eq = text.find('=');
  if (eq == std::string::npos) {
    return std::nullopt;
  }
  std::string name = common::trim(text.substr(0, eq));
  if (!is_env_name(name)) {
    return std::nullopt;
  }
  return std::make_pair(std::move(name), unquote_env_value(text.substr(eq + 1)));
}

// Variables already set in the process environment win over every .env file, and earlier
// files win over later ones.
void load_dotenv_files() {
  std::vector<std::filesystem::path> files;
  if (const char *explicit_file = env_value("RAGVIX_ENV_FILE"); explicit_file != nullptr) {
    files.emplace_back(common::expand_path(explicit_file));
  }
  if (const auto dir = config_dir(); dir.ok()) {
    files.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  if (const auto cwd = std::filesystem::current_path(ec); !ec) {
    files.push_back(cwd / ".env");
  }

  for (const auto &file_path : files) {
    std::ifstream file(file_path);
    std::string line;
    while (file && std::getline(file, line)) {
      if (const auto assignment = parse_env_line(line); assignment.has_value()) {
        setenv(assignment->first.c_str(), assignment->second.c_str(), 0);
      }
    }
  }
}

// Typed readers. Each appends to `errors` instead of failing fast so that a single
// load reports every malformed key at once.

void read_string(const common::TomlDocument &doc, const std::string &key, std::string &target,
                 std::vector<std::string> &errors) {
  if (!doc.has(key)) {
    return;
  }
  const std::string raw = common::trim(doc.values.at(key));
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    errors.push_back(key + " must be a quoted string");
    return;
  }
  target = doc.get_string(key);
}

void read_u64(const common::TomlDocument &doc, const std::string &key, std::uint64_t &target,
              std::vector<std::string> &errors) {
  if (!doc.has(key)) {
    return;
  }
  const auto parsed = doc.try_u64(key);
  if (!parsed.has_value()) {
    errors.push_back(key + " must be a non-negative integer");
    return;
  }
  target = *parsed;
}

void read_bool(const common::TomlDocument &doc, const std::string &key, bool &target,
               std::vector<std::string> &errors) {
  if (!doc.has(key)) {
    return;
  }
  const auto parsed = doc.try_bool(key);
  if (!parsed.has_value()) {
    errors.push_back(key + " must be true or false");
    return;
  }
  target = *parsed;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string join_errors(const std::vector<std::string> &errors) {
  std::ostringstream stream;
  for (std::size_t i = 0; i < errors.size(); ++i) {
    if (i > 0) {
      stream << "; ";
    }
    stream << errors[i];
  }
  return stream.str();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  using R = common::Result<std::filesystem::path>;
  if (const auto target = resolved_config_path_override(); target.has_value()) {
    if (names_directory(*target)) {
      return common::ensure_dir(*target);
    }
    std::error_code ec;
    const auto parent = target->has_parent_path() ? target->parent_path()
                                                  : std::filesystem::current_path(ec);
    if (ec) {
      return R::failure(common::ErrorCode::IoError, "unable to resolve current directory");
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return R::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  using R = common::Result<std::filesystem::path>;
  if (const auto target = resolved_config_path_override(); target.has_value()) {
    return R::success(names_directory(*target) ? *target / CONFIG_FILENAME : *target);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return R::failure(dir.status());
  }
  return R::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *location = env_value("RAGVIX_INDEX_LOCATION"); location != nullptr) {
    config.index.location = location;
  }
  if (const char *model = env_value("RAGVIX_EMBEDDING_MODEL"); model != nullptr) {
    config.embedding.model_id = model;
  }
  if (const char *api_key = env_value("RAGVIX_EMBEDDING_API_KEY"); api_key != nullptr) {
    config.embedding.api_key = api_key;
    return;
  }
  if (!common::trim(config.embedding.api_key).empty()) {
    return;
  }
  if (const char *openai_key = env_value("OPENAI_API_KEY"); openai_key != nullptr) {
    config.embedding.api_key = openai_key;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const common::TomlDocument &doc = parsed.value();

  std::vector<std::string> errors;
  for (const auto &key : doc.keys()) {
    if (!is_known_key(key)) {
      errors.push_back("unknown option: " + key);
    }
  }

  Config config;
  read_u64(doc, "chunking.window_size", config.chunking.window_size, errors);
  read_u64(doc, "chunking.overlap", config.chunking.overlap, errors);
  read_string(doc, "chunking.unit", config.chunking.unit, errors);

  read_string(doc, "embedding.provider", config.embedding.provider, errors);
  read_string(doc, "embedding.model_id", config.embedding.model_id, errors);
  read_u64(doc, "embedding.batch_size", config.embedding.batch_size, errors);
  read_u64(doc, "embedding.dimensions", config.embedding.dimensions, errors);
  read_string(doc, "embedding.endpoint", config.embedding.endpoint, errors);
  read_string(doc, "embedding.api_key", config.embedding.api_key, errors);
  read_u64(doc, "embedding.timeout_ms", config.embedding.timeout_ms, errors);

  read_string(doc, "index.location", config.index.location, errors);
  read_string(doc, "index.distance_metric", config.index.distance_metric, errors);
  read_string(doc, "index.on_duplicate", config.index.on_duplicate, errors);
  read_bool(doc, "index.allow_empty", config.index.allow_empty, errors);

  read_u64(doc, "retrieval.max_chunks_per_document", config.retrieval.max_chunks_per_document,
           errors);
  read_u64(doc, "retrieval.candidate_multiplier", config.retrieval.candidate_multiplier, errors);
  read_u64(doc, "retrieval.default_k", config.retrieval.default_k, errors);

  read_string(doc, "observability.backend", config.observability.backend, errors);

  if (!errors.empty()) {
    return common::Result<Config>::failure(common::ErrorCode::InvalidConfiguration,
                                           join_errors(errors));
  }
  config.index.location = common::expand_path(config.index.location);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  Config config;
  const auto path = cfg_path_result.value();
  if (std::filesystem::exists(path)) {
    auto content = common::read_file(path);
    if (!content.ok()) {
      return common::Result<Config>::failure(content.status());
    }
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(parsed.code(),
                                             path.string() + ": " + parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);

  const auto validated = validate_config(config);
  if (!validated.ok()) {
    return common::Result<Config>::failure(validated.status());
  }
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto target = config_path();
  if (!target.ok()) {
    return target.status();
  }
  const std::filesystem::path &path = target.value();
  if (path.has_parent_path()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return dir.status();
    }
  }

  std::ostringstream out;
  out << "[chunking]\n"
      << "window_size = " << config.chunking.window_size << "\n"
      << "overlap = " << config.chunking.overlap << "\n"
      << "unit = " << common::quote_toml_string(config.chunking.unit) << "\n";

  out << "\n[embedding]\n"
      << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  if (!config.embedding.model_id.empty()) {
    out << "model_id = " << common::quote_toml_string(config.embedding.model_id) << "\n";
  }
  out << "batch_size = " << config.embedding.batch_size << "\n"
      << "dimensions = " << config.embedding.dimensions << "\n"
      << "endpoint = " << common::quote_toml_string(config.embedding.endpoint) << "\n";
  if (!config.embedding.api_key.empty()) {
    out << "api_key = " << common::quote_toml_string(config.embedding.api_key) << "\n";
  }
  out << "timeout_ms = " << config.embedding.timeout_ms << "\n";

  out << "\n[index]\n"
      << "location = " << common::quote_toml_string(config.index.location) << "\n"
      << "distance_metric = " << common::quote_toml_string(config.index.distance_metric) << "\n"
      << "on_duplicate = " << common::quote_toml_string(config.index.on_duplicate) << "\n"
      << "allow_empty = " << bool_to_toml(config.index.allow_empty) << "\n";

  out << "\n[retrieval]\n"
      << "max_chunks_per_document = " << config.retrieval.max_chunks_per_document << "\n"
      << "candidate_multiplier = " << config.retrieval.candidate_multiplier << "\n"
      << "default_k = " << config.retrieval.default_k << "\n";

  out << "\n[observability]\n"
      << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  // Written beside the target and renamed over it so readers never see a partial file.
  const std::filesystem::path staging = path.string() + ".tmp";
  {
    std::ofstream file(staging, std::ios::trunc);
    file << out.str();
    if (!file.flush()) {
      return common::Status::error(common::ErrorCode::IoError,
                                   "cannot write " + staging.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(staging, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::IoError,
                                 "cannot replace " + path.string() + ": " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using R = common::Result<std::vector<std::string>>;
  constexpr auto invalid = common::ErrorCode::InvalidConfiguration;
  std::vector<std::string> warnings;

  if (config.chunking.window_size == 0) {
    return R::failure(invalid, "chunking.window_size must be > 0");
  }
  if (config.chunking.overlap >= config.chunking.window_size) {
    return R::failure(invalid, "chunking.overlap must be smaller than chunking.window_size");
  }
  if (!corpus::parse_chunk_unit(config.chunking.unit).ok()) {
    return R::failure(invalid, "Invalid chunking.unit: " + config.chunking.unit);
  }

  const std::string provider = common::to_lower(common::trim(config.embedding.provider));
  if (provider != "local" && provider != "openai") {
    return R::failure(invalid, "Invalid embedding.provider: " + config.embedding.provider);
  }
  if (config.embedding.batch_size == 0) {
    return R::failure(invalid, "embedding.batch_size must be > 0");
  }
  if (config.embedding.dimensions == 0) {
    return R::failure(invalid, "embedding.dimensions must be > 0");
  }
  if (provider == "openai") {
    if (common::trim(config.embedding.endpoint).empty()) {
      return R::failure(invalid, "embedding.endpoint is required for the openai provider");
    }
    if (config.embedding.timeout_ms == 0) {
      return R::failure(invalid, "embedding.timeout_ms must be > 0");
    }
    if (common::trim(config.embedding.api_key).empty()) {
      warnings.push_back(
          "embedding API key is missing (embedding.api_key, RAGVIX_EMBEDDING_API_KEY or "
          "OPENAI_API_KEY)");
    }
  }

  if (common::trim(config.index.location).empty()) {
    return R::failure(invalid, "index.location must not be empty");
  }
  if (!index::parse_distance_metric(config.index.distance_metric).ok()) {
    return R::failure(invalid, "Invalid index.distance_metric: " + config.index.distance_metric);
  }
  if (!index::parse_duplicate_policy(config.index.on_duplicate).ok()) {
    return R::failure(invalid, "Invalid index.on_duplicate: " + config.index.on_duplicate);
  }

  if (config.retrieval.candidate_multiplier == 0) {
    return R::failure(invalid, "retrieval.candidate_multiplier must be >= 1");
  }
  if (config.retrieval.default_k == 0) {
    return R::failure(invalid, "retrieval.default_k must be > 0");
  }
  if (config.retrieval.default_k > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
    return R::failure(invalid, "retrieval.default_k must not exceed INT_MAX");
  }

  if (config.chunking.overlap * 2 > config.chunking.window_size) {
    warnings.push_back("chunking.overlap exceeds half of chunking.window_size");
  }

  return R::success(std::move(warnings));
}

} // namespace ragvix::config
