#include "ragvix/common/fs.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>

namespace ragvix::common {

namespace {

constexpr const char *kWhitespace = " \t\n\r\f\v";

} // namespace

std::string trim(const std::string &input) {
  const auto first = input.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  const auto last = input.find_last_not_of(kWhitespace);
  return input.substr(first, last - first + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (auto &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return Result<std::filesystem::path>::failure(ErrorCode::IoError, "HOME is not set");
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::IoError, "cannot create directory " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (starts_with(value, "~")) {
    if (const auto home = home_dir(); home.ok()) {
      value = home.value().string() + value.substr(1);
    }
  }

  // $NAME and ${NAME}; unset variables expand to nothing.
  static const std::regex variable(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::string out;
  auto cursor = value.cbegin();
  for (std::sregex_iterator it(value.begin(), value.end(), variable), end; it != end; ++it) {
    const auto &match = *it;
    out.append(cursor, match[0].first);
    if (const char *resolved = std::getenv(match[1].str().c_str()); resolved != nullptr) {
      out += resolved;
    }
    cursor = match[0].second;
  }
  out.append(cursor, value.cend());
  return out;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorCode::IoError, "failed to open " + path.string());
  }
  std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return Result<std::string>::failure(ErrorCode::IoError, "failed to read " + path.string());
  }
  return Result<std::string>::success(std::move(content));
}

} // namespace ragvix::common
