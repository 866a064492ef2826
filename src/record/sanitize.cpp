#include "record/sanitize.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <vector>

namespace k7 {
namespace record {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_alnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

char to_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), to_lower);
  return value;
}

std::string trim(const std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  return (begin < end) ? std::string(begin, end) : std::string();
}

// Drops anything between '<' and the next '>'. An unterminated tag removes
// the rest of the string.
std::string strip_tags(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  bool in_tag = false;
  for (char c : value) {
    if (c == '<') {
      in_tag = true;
    } else if (c == '>' && in_tag) {
      in_tag = false;
    } else if (!in_tag) {
      out.push_back(c);
    }
  }
  return out;
}

// Folds whitespace runs to one space; with keep_newlines a run that holds a
// line break is folded to a single '\n' instead
std::string collapse_whitespace(const std::string& value, bool keep_newlines) {
  std::string out;
  out.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    if (!is_space(value[i])) {
      out.push_back(value[i++]);
      continue;
    }
    bool newline = false;
    while (i < value.size() && is_space(value[i])) {
      newline = newline || value[i] == '\n';
      ++i;
    }
    out.push_back(keep_newlines && newline ? '\n' : ' ');
  }
  return trim(out);
}

bool is_email_local_char(char c) {
  static const std::string allowed = "!#$%&'*+/=?^_`{|}~.-";
  return is_alnum(c) || allowed.find(c) != std::string::npos;
}

bool is_url_char(char c) {
  static const std::string allowed = "-~+_.?#=!&;,/:%@$|*'()[]";
  return is_alnum(c) || allowed.find(c) != std::string::npos
      || static_cast<unsigned char>(c) >= 0x80;
}

} // namespace

//==============================================
// FIELD SANITIZERS
//==============================================

std::string normalize_key(const std::string& raw) {
  std::string kept;
  for (char c : strip_tags(raw)) {
    if (is_alnum(c) || c == '_' || c == '.' || c == '-' || c == '@' || is_space(c)) {
      kept.push_back(is_space(c) ? ' ' : to_lower(c));
    }
  }
  return collapse_whitespace(kept, false);
}

std::string sanitize_email(const std::string& raw) {
  std::string email = trim(raw);
  if (email.size() < 6) {
    return {};
  }

  size_t at = email.find('@');
  if (at == std::string::npos || at == 0 || email.find('@', at + 1) != std::string::npos) {
    return {};
  }

  std::string local;
  std::copy_if(email.begin(), email.begin() + at, std::back_inserter(local), is_email_local_char);
  if (local.empty()) {
    return {};
  }

  // Domain labels: [a-z0-9-], no leading or trailing '-', at least two labels
  std::string domain = lower(email.substr(at + 1));
  std::vector<std::string> labels;
  std::stringstream ss(domain);
  std::string label;
  while (std::getline(ss, label, '.')) {
    std::string clean;
    std::copy_if(label.begin(), label.end(), std::back_inserter(clean),
                 [](char c) { return is_alnum(c) || c == '-'; });
    while (!clean.empty() && clean.front() == '-') clean.erase(clean.begin());
    while (!clean.empty() && clean.back() == '-') clean.pop_back();
    if (!clean.empty()) {
      labels.push_back(clean);
    }
  }
  if (labels.size() < 2) {
    return {};
  }

  std::string out = local + "@";
  for (size_t i = 0; i < labels.size(); ++i) {
    out += (i == 0 ? "" : ".") + labels[i];
  }
  return out;
}

std::string sanitize_url(const std::string& raw) {
  std::string url;
  for (char c : trim(raw)) {
    if (is_url_char(c)) {
      url.push_back(c);
    }
  }
  if (url.empty()) {
    return {};
  }

  // Relative references are kept as they are
  if (url.front() == '/' || url.front() == '#' || url.front() == '?') {
    return url;
  }

  size_t colon = url.find(':');
  size_t first_delim = url.find_first_of("/?#");
  bool has_scheme = colon != std::string::npos && (first_delim == std::string::npos || colon < first_delim);
  if (!has_scheme) {
    return "http://" + url;
  }

  static const std::array<const char*, 5> allowed_schemes = {"http", "https", "ftp", "ftps", "mailto"};
  std::string scheme = lower(url.substr(0, colon));
  bool allowed = std::any_of(allowed_schemes.begin(), allowed_schemes.end(),
                             [&](const char* s) { return scheme == s; });
  return allowed ? url : std::string();
}

std::string sanitize_slug(const std::string& raw) {
  std::string slug;
  for (char c : lower(strip_tags(raw))) {
    if (is_alnum(c) || c == '_') {
      slug.push_back(c);
    } else if (c == '-' || c == '.' || is_space(c)) {
      if (!slug.empty() && slug.back() != '-') {
        slug.push_back('-');
      }
    }
  }
  while (!slug.empty() && slug.back() == '-') {
    slug.pop_back();
  }
  return slug;
}

std::string sanitize_text(const std::string& raw) {
  return collapse_whitespace(strip_tags(raw), false);
}

std::string sanitize_textarea(const std::string& raw) {
  return collapse_whitespace(strip_tags(raw), true);
}

std::string format_utc(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
  gmtime_r(&t, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

//==============================================
// STORE REQUESTS
//==============================================

Record make_store_request(const Record& incoming, const std::string& normalized_key,
                          std::chrono::system_clock::time_point now) {
  const Attributes& in = incoming.attributes;

  Record request;
  request.key = normalized_key;
  request.credential_hash = incoming.credential_hash;

  Attributes& out = request.attributes;
  out.email = sanitize_email(in.email.value_or(""));
  out.url = sanitize_url(in.url.value_or(""));

  std::string nice_key = in.nice_key ? sanitize_slug(*in.nice_key) : std::string();
  out.nice_key = nice_key.empty() ? sanitize_slug(normalized_key) : nice_key;

  out.display_name = in.display_name ? sanitize_text(*in.display_name) : normalized_key;
  out.first_name = sanitize_text(in.first_name.value_or(""));
  out.last_name = sanitize_text(in.last_name.value_or(""));
  out.description = sanitize_textarea(in.description.value_or(""));

  std::string registered = trim(in.registered_at.value_or(""));
  out.registered_at = registered.empty() ? format_utc(now) : registered;

  return request;
}

} // namespace record
} // namespace k7
