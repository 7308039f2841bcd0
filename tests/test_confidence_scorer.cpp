#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "scoring/confidence_scorer.hpp"

using namespace sanitizer;

namespace {

SecretScanResult secret_scan(double confidence, double risk) {
    SecretScanResult r;
    r.scan_confidence = confidence;
    r.remaining_risk = risk;
    return r;
}

PiiScanResult pii_scan(double confidence, double risk) {
    PiiScanResult r;
    r.scan_confidence = confidence;
    r.remaining_risk = risk;
    return r;
}

MREResult mre(double quality, bool syntax_valid) {
    MREResult r;
    r.quality_score = quality;
    r.syntax_valid = syntax_valid;
    return r;
}

} // namespace

TEST_CASE("ConfidenceScorer weights", "[confidence_scorer]") {

    SECTION("Clean text, no code, no refinement") {
        // 0.35 * 0.98 + 0.25 * 1.0 + 0.15 + 0.1 + 0.05
        const double score = ConfidenceScorer::score(
            secret_scan(0.98, 0.0), pii_scan(1.0, 0.0), std::nullopt, false);
        REQUIRE(score == Catch::Approx(0.893));
    }

    SECTION("One secret and one email") {
        // 0.35 * 0.95 * 0.95 + 0.25 * 0.98 * 0.95 + 0.15 + 0.1 + 0.05
        const double score = ConfidenceScorer::score(
            secret_scan(0.95, 0.1), pii_scan(0.98, 0.1), std::nullopt, false);
        REQUIRE(score == Catch::Approx(0.848625));
    }

    SECTION("MRE quality and syntax") {
        const double valid = ConfidenceScorer::score(
            secret_scan(1.0, 0.0), pii_scan(1.0, 0.0), mre(0.5, true), false);
        REQUIRE(valid == Catch::Approx(0.35 + 0.25 + 0.1 + 0.1 + 0.05));

        const double invalid = ConfidenceScorer::score(
            secret_scan(1.0, 0.0), pii_scan(1.0, 0.0), mre(0.5, false), false);
        REQUIRE(invalid == Catch::Approx(0.35 + 0.25 + 0.1 + 0.05 + 0.05));
    }

    SECTION("Refinement raises the score") {
        const double without = ConfidenceScorer::score(
            secret_scan(0.98, 0.0), pii_scan(1.0, 0.0), std::nullopt, false);
        const double with = ConfidenceScorer::score(
            secret_scan(0.98, 0.0), pii_scan(1.0, 0.0), std::nullopt, true);
        REQUIRE(with - without == Catch::Approx(0.05));
    }
}

TEST_CASE("ConfidenceScorer bounds", "[confidence_scorer]") {

    SECTION("Maximum is 1") {
        const double score = ConfidenceScorer::score(
            secret_scan(1.0, 0.0), pii_scan(1.0, 0.0), mre(1.0, true), true);
        REQUIRE(score == Catch::Approx(1.0));
        REQUIRE(score <= 1.0);
    }

    SECTION("Worst inputs stay non-negative") {
        const double score = ConfidenceScorer::score(
            secret_scan(0.0, 1.0), pii_scan(0.0, 1.0), mre(0.0, false), false);
        REQUIRE(score >= 0.0);
        REQUIRE(score == Catch::Approx(0.1));
    }
}

TEST_CASE("ConfidenceScorer merge_into", "[confidence_scorer]") {

    ScanResult merged;
    ScanResult a;
    a.findings.push_back(Finding{.rule_name = "email"});
    a.remaining_risk = 0.1;
    a.scan_confidence = 0.98;

    ScanResult b;
    b.findings.push_back(Finding{.rule_name = "ipv4_address"});
    b.findings.push_back(Finding{.rule_name = "email"});
    b.remaining_risk = 0.05;
    b.scan_confidence = 0.96;

    ConfidenceScorer::merge_into(merged, a);
    ConfidenceScorer::merge_into(merged, b);

    REQUIRE(merged.findings.size() == 3);
    REQUIRE(merged.findings[0].rule_name == "email");
    REQUIRE(merged.remaining_risk == Catch::Approx(0.1));
    REQUIRE(merged.scan_confidence == Catch::Approx(0.96));
}
