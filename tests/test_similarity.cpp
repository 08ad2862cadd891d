#include "test_framework.hpp"

#include "notegraph/graph/similarity.hpp"

#include <cmath>

namespace {

bool near(const double actual, const double expected, const double epsilon = 1e-3) {
  return std::fabs(actual - expected) < epsilon;
}

} // namespace

void register_similarity_tests(std::vector<notegraph::tests::TestCase> &tests) {
  using notegraph::tests::require;
  namespace graph = notegraph::graph;

  tests.push_back({"similarity_identical_strings_score_one", [] {
                     for (const std::string value : {"Note", "machine learning", "서울에서", "a"}) {
                       const auto score = graph::calculate_similarity(value, value);
                       require(score.score == 1.0, "identical strings must score exactly 1: " + value);
                     }
                   }});

  tests.push_back({"similarity_disjoint_strings_score_near_zero", [] {
                     const auto score = graph::calculate_similarity("abc", "xyz");
                     require(score.score < 0.05, "disjoint strings should score near zero");
                     require(score.jaro_winkler == 0.0, "no common characters");
                     require(graph::calculate_similarity("", "abc").score == 0.0,
                             "empty string scores zero");
                   }});

  tests.push_back({"similarity_jaro_winkler_reference_values", [] {
                     require(near(graph::jaro_winkler_similarity("MARTHA", "MARHTA"), 0.9611),
                             "MARTHA/MARHTA");
                     require(near(graph::jaro_winkler_similarity("DIXON", "DICKSONX"), 0.8133),
                             "DIXON/DICKSONX");
                     require(graph::jaro_winkler_similarity("", "") == 1.0, "two empty strings");
                     require(graph::jaro_winkler_similarity("a", "") == 0.0, "one empty string");
                   }});

  tests.push_back({"similarity_ngram_dice", [] {
                     require(near(graph::ngram_similarity("night", "nacht"), 0.25),
                             "one shared bigram out of eight");
                     require(graph::ngram_similarity("a", "A") == 1.0,
                             "short strings compare as a single gram after lowercasing");
                     require(graph::ngram_similarity("abc", "") == 0.0, "empty input");
                   }});

  tests.push_back({"similarity_token_overlap", [] {
                     require(graph::token_overlap_similarity("machine learning", "Learning-Machine") ==
                                 1.0,
                             "token order and separators should not matter");
                     require(near(graph::token_overlap_similarity("deep learning basics",
                                                                  "deep learning"),
                                  2.0 / 3.0),
                             "jaccard of token sets");
                     require(graph::token_overlap_similarity("...", "!!!") == 0.0,
                             "separator-only strings have no tokens");
                   }});

  tests.push_back({"similarity_korean_particles_stripped", [] {
                     require(graph::similarity_tokens("서울에서 학교를") ==
                                 std::vector<std::string>({"서울", "학교"}),
                             "compound and single particles should be removed");
                     require(graph::similarity_tokens("가") == std::vector<std::string>({"가"}),
                             "single syllable tokens are kept whole");
                     require(graph::token_overlap_similarity("서울에서", "서울") == 1.0,
                             "particle variants share a token");
                   }});

  tests.push_back({"similarity_non_ascii_case_variants", [] {
                     const auto cyrillic = graph::calculate_similarity("Ключ", "ключ");
                     require(cyrillic.ngram == 1.0 && cyrillic.token_overlap == 1.0 &&
                                 cyrillic.containment == 1.0,
                             "case-folded components see identical strings");
                     require(cyrillic.score > 0.9, "cyrillic case variants score high");
                     require(graph::is_similar("Élan Vital", "élan vital"), "accented case variants");
                     require(graph::similarity_tokens("ΣΟΦΙΑ Wisdom") ==
                                 std::vector<std::string>({"σοφια", "wisdom"}),
                             "tokens are lowercased across scripts");
                   }});

  tests.push_back({"similarity_containment", [] {
                     require(near(graph::containment_similarity("Machine Learning", "machine"),
                                  7.0 / 16.0),
                             "containment is the length ratio");
                     require(graph::containment_similarity("abc", "abcd") == 0.75, "3/4");
                     require(graph::containment_similarity("abc", "xyz") == 0.0, "no containment");
                     require(graph::containment_similarity(" ABC ", "abc") == 1.0,
                             "normalized equal strings");
                   }});

  tests.push_back({"similarity_composite_weights", [] {
                     const auto contained = graph::calculate_similarity("Learning", "Deep Learning");
                     require(contained.containment > 0.5, "containment branch precondition");
                     const double expected_contained =
                         0.3 * contained.jaro_winkler + 0.2 * contained.ngram +
                         0.2 * contained.token_overlap + 0.3 * contained.containment;
                     require(near(contained.score, expected_contained, 1e-9),
                             "containment-weighted composite");

                     const auto plain = graph::calculate_similarity("Machine Learning", "Machine-Learning");
                     require(plain.containment == 0.0, "no containment");
                     const double expected_plain =
                         0.4 * plain.jaro_winkler + 0.3 * plain.ngram + 0.3 * plain.token_overlap;
                     require(near(plain.score, expected_plain, 1e-9), "default composite");
                     require(plain.score > 0.9, "hyphen variant should be very similar");
                   }});

  tests.push_back({"similarity_is_similar_threshold", [] {
                     require(graph::is_similar("Machine Learning", "machine learning"),
                             "case variants are similar");
                     require(!graph::is_similar("Machine Learning", "Quantum Physics"),
                             "unrelated titles are not");
                     require(graph::is_similar("abc", "xyz", 0.0), "threshold zero accepts all");
                   }});

  tests.push_back({"similarity_find_pairs_sorted", [] {
                     const std::vector<std::string> titles{"Machine-Learning", "Quantum Physics",
                                                           "machine learning", "Machine Learning"};
                     const auto pairs = graph::find_similar_pairs(titles, 0.7);
                     require(pairs.size() == 3, "three machine learning pairs");
                     for (std::size_t i = 0; i < pairs.size(); ++i) {
                       require(pairs[i].first < pairs[i].second, "pairs use i < j");
                       require(pairs[i].first != 1 && pairs[i].second != 1,
                               "unrelated title should not pair");
                       if (i > 0) {
                         require(pairs[i - 1].similarity.score >= pairs[i].similarity.score,
                                 "pairs sorted by descending score");
                       }
                     }
                   }});
}
