#include "notegraph/graph/similarity.hpp"

#include "notegraph/common/utf8.hpp"

#include <algorithm>
#include <array>
#include <set>

namespace notegraph::graph {

namespace {

constexpr std::array<std::u32string_view, 8> COMPOUND_PARTICLES = {
    U"으로", U"에서", U"에게", U"까지", U"부터", U"처럼", U"만큼", U"보다"};
constexpr std::u32string_view SINGLE_PARTICLES = U"은는이가을를의에와과로";
constexpr std::u32string_view TOKEN_SEPARATORS = U"-_.,;:!?'\"()[]{}";

double jaro_similarity(const std::u32string &s1, const std::u32string &s2) {
  if (s1 == s2) {
    return 1.0;
  }
  if (s1.empty() || s2.empty()) {
    return 0.0;
  }

  const std::size_t longest = std::max(s1.size(), s2.size());
  const std::size_t window = longest / 2 > 0 ? longest / 2 - 1 : 0;
  std::vector<bool> s1_matches(s1.size(), false);
  std::vector<bool> s2_matches(s2.size(), false);

  std::size_t matches = 0;
  for (std::size_t i = 0; i < s1.size(); ++i) {
    const std::size_t start = i > window ? i - window : 0;
    const std::size_t end = std::min(i + window + 1, s2.size());
    for (std::size_t j = start; j < end; ++j) {
      if (s2_matches[j] || s1[i] != s2[j]) {
        continue;
      }
      s1_matches[i] = true;
      s2_matches[j] = true;
      ++matches;
      break;
    }
  }
  if (matches == 0) {
    return 0.0;
  }

  std::size_t transpositions = 0;
  std::size_t k = 0;
  for (std::size_t i = 0; i < s1.size(); ++i) {
    if (!s1_matches[i]) {
      continue;
    }
    while (!s2_matches[k]) {
      ++k;
    }
    if (s1[i] != s2[k]) {
      ++transpositions;
    }
    ++k;
  }

  const double m = static_cast<double>(matches);
  const double t = static_cast<double>(transpositions) / 2.0;
  return (m / static_cast<double>(s1.size()) + m / static_cast<double>(s2.size()) + (m - t) / m) /
         3.0;
}

std::u32string normalize_for_comparison(const std::string &text) {
  return common::trim_code_points(common::unicode_lower(common::utf8_decode(text)));
}

std::set<std::u32string> ngrams_of(const std::string &text, const std::size_t n) {
  std::set<std::u32string> grams;
  const std::u32string normalized = normalize_for_comparison(text);
  if (normalized.empty()) {
    return grams;
  }
  if (normalized.size() < n || n == 0) {
    grams.insert(normalized);
    return grams;
  }
  for (std::size_t i = 0; i + n <= normalized.size(); ++i) {
    grams.insert(normalized.substr(i, n));
  }
  return grams;
}

bool is_token_separator(const char32_t cp) {
  return common::is_unicode_space(cp) || TOKEN_SEPARATORS.find(cp) != std::u32string_view::npos;
}

std::u32string strip_particle(std::u32string token) {
  if (token.empty() || !common::is_hangul_syllable(token.back())) {
    return token;
  }
  if (token.size() > 2) {
    for (const auto particle : COMPOUND_PARTICLES) {
      if (std::u32string_view(token).ends_with(particle)) {
        token.resize(token.size() - particle.size());
        return token;
      }
    }
  }
  if (token.size() > 1 && SINGLE_PARTICLES.find(token.back()) != std::u32string_view::npos) {
    token.pop_back();
  }
  return token;
}

std::vector<std::u32string> tokenize(const std::string &text) {
  const std::u32string lowered = common::unicode_lower(common::utf8_decode(text));
  std::vector<std::u32string> tokens;
  std::u32string current;
  for (const char32_t cp : lowered) {
    if (is_token_separator(cp)) {
      if (!current.empty()) {
        tokens.push_back(strip_particle(std::move(current)));
        current.clear();
      }
      continue;
    }
    current.push_back(cp);
  }
  if (!current.empty()) {
    tokens.push_back(strip_particle(std::move(current)));
  }
  return tokens;
}

} // namespace

double jaro_winkler_similarity(const std::string &s1, const std::string &s2,
                               const double prefix_scale) {
  const std::u32string a = common::utf8_decode(s1);
  const std::u32string b = common::utf8_decode(s2);
  const double jaro = jaro_similarity(a, b);

  const std::size_t max_prefix = std::min<std::size_t>(4, std::min(a.size(), b.size()));
  std::size_t prefix = 0;
  while (prefix < max_prefix && a[prefix] == b[prefix]) {
    ++prefix;
  }
  return jaro + static_cast<double>(prefix) * prefix_scale * (1.0 - jaro);
}

double ngram_similarity(const std::string &s1, const std::string &s2, const std::size_t n) {
  if (s1 == s2) {
    return 1.0;
  }
  if (s1.empty() || s2.empty()) {
    return 0.0;
  }

  const auto grams1 = ngrams_of(s1, n);
  const auto grams2 = ngrams_of(s2, n);
  if (grams1.empty() && grams2.empty()) {
    return 0.0;
  }

  std::size_t intersection = 0;
  for (const auto &gram : grams1) {
    if (grams2.contains(gram)) {
      ++intersection;
    }
  }
  return 2.0 * static_cast<double>(intersection) /
         static_cast<double>(grams1.size() + grams2.size());
}

double token_overlap_similarity(const std::string &s1, const std::string &s2) {
  if (s1 == s2) {
    return 1.0;
  }
  if (s1.empty() || s2.empty()) {
    return 0.0;
  }

  const auto list1 = tokenize(s1);
  const auto list2 = tokenize(s2);
  const std::set<std::u32string> tokens1(list1.begin(), list1.end());
  const std::set<std::u32string> tokens2(list2.begin(), list2.end());
  if (tokens1.empty() || tokens2.empty()) {
    return 0.0;
  }

  std::size_t intersection = 0;
  for (const auto &token : tokens1) {
    if (tokens2.contains(token)) {
      ++intersection;
    }
  }
  const std::size_t union_size = tokens1.size() + tokens2.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(union_size);
}

double containment_similarity(const std::string &s1, const std::string &s2) {
  const std::u32string n1 = normalize_for_comparison(s1);
  const std::u32string n2 = normalize_for_comparison(s2);
  if (n1 == n2) {
    return 1.0;
  }
  if (n1.find(n2) != std::u32string::npos) {
    return static_cast<double>(n2.size()) / static_cast<double>(n1.size());
  }
  if (n2.find(n1) != std::u32string::npos) {
    return static_cast<double>(n1.size()) / static_cast<double>(n2.size());
  }
  return 0.0;
}

SimilarityScore calculate_similarity(const std::string &s1, const std::string &s2) {
  SimilarityScore result{.score = 0.0,
                         .jaro_winkler = jaro_winkler_similarity(s1, s2),
                         .ngram = ngram_similarity(s1, s2),
                         .token_overlap = token_overlap_similarity(s1, s2),
                         .containment = containment_similarity(s1, s2)};

  if (s1 == s2) {
    result.score = 1.0;
  } else if (result.containment > 0.5) {
    result.score = 0.3 * result.jaro_winkler + 0.2 * result.ngram + 0.2 * result.token_overlap +
                   0.3 * result.containment;
  } else {
    result.score = 0.4 * result.jaro_winkler + 0.3 * result.ngram + 0.3 * result.token_overlap;
  }
  result.score = std::clamp(result.score, 0.0, 1.0);
  return result;
}

bool is_similar(const std::string &s1, const std::string &s2, const double threshold) {
  return calculate_similarity(s1, s2).score >= threshold;
}

std::vector<std::string> similarity_tokens(const std::string &text) {
  std::vector<std::string> out;
  for (const auto &token : tokenize(text)) {
    out.push_back(common::utf8_encode(token));
  }
  return out;
}

std::vector<SimilarPair> find_similar_pairs(const std::vector<std::string> &strings,
                                            const double threshold) {
  std::vector<SimilarPair> pairs;
  for (std::size_t i = 0; i < strings.size(); ++i) {
    for (std::size_t j = i + 1; j < strings.size(); ++j) {
      auto similarity = calculate_similarity(strings[i], strings[j]);
      if (similarity.score >= threshold) {
        pairs.push_back(SimilarPair{.first = i, .second = j, .similarity = similarity});
      }
    }
  }
  std::stable_sort(pairs.begin(), pairs.end(), [](const SimilarPair &a, const SimilarPair &b) {
    return a.similarity.score > b.similarity.score;
  });
  return pairs;
}

} // namespace notegraph::graph
