#include "utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::optional<std::string> sha256_file(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if(!in) return std::nullopt;

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return std::nullopt;

  std::array<char, 65536> buffer{};
  while(in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize read = in.gcount();
    if(read > 0) {
      if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(read)) != 1) {
        return std::nullopt;
      }
    }
  }
  if(in.bad()) return std::nullopt;

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if(EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) return std::nullopt;

  return hex_from_bytes(std::vector<unsigned char>(digest, digest + digest_len));
}

bool is_sha256_hex(const std::string& candidate) {
  if(candidate.size() != 64) return false;
  return std::all_of(candidate.begin(), candidate.end(), [](unsigned char ch){
    return std::isdigit(ch) || (ch >= 'a' && ch <= 'f');
  });
}

std::string sanitize_host(const std::string& host) {
  std::string out = host;
  for(auto& ch : out) {
    unsigned char c = static_cast<unsigned char>(ch);
    if(!(std::isalnum(c) || c == '.' || c == '_' || c == '-')) ch = '_';
  }
  return out;
}

std::string timestamp_compact(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&t, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y%m%d-%H%M%S");
  return oss.str();
}

std::string timestamp_compact_ms(std::chrono::system_clock::time_point when) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    when.time_since_epoch()).count() % 1000;
  std::ostringstream oss;
  oss << timestamp_compact(when) << '-' << std::setw(3) << std::setfill('0') << ms;
  return oss.str();
}

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_list(const std::string& value, char separator) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(value);
  while(std::getline(in, item, separator)) {
    item.erase(item.begin(), std::find_if(item.begin(), item.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    item.erase(std::find_if(item.rbegin(), item.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), item.end());
    if(!item.empty()) out.push_back(item);
  }
  return out;
}

std::string trim_whitespace(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}
