#include "mre/mre_synthesizer.hpp"
#include "mre/language_analyzer.hpp"
#include "mre/name_abstractor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace sanitizer {

namespace {

constexpr std::array<std::string_view, 8> ERROR_INDICATORS = {
    "raise", "assert", "except", "error", "fail",
    "# todo", "# fixme", "# bug"
};

constexpr std::string_view kErrorMarker = "<-- ERROR OCCURS HERE";

bool has_error_indicator(std::string_view line) {
    const auto lower = utils::to_lower(line);
    return std::ranges::any_of(ERROR_INDICATORS, [&lower](std::string_view ind) {
        return lower.find(ind) != std::string::npos;
    });
}

// First n bytes without splitting a UTF-8 sequence; newlines folded to spaces
std::string summarize(const std::string& text, size_t n) {
    size_t cut = std::min(n, text.size());
    while (cut > 0 && cut < text.size()
           && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string summary = text.substr(0, cut);
    std::ranges::replace(summary, '\n', ' ');
    std::ranges::replace(summary, '\r', ' ');
    return summary;
}

} // anonymous namespace

std::string MRESynthesizer::add_error_marker(const std::string& body,
                                             const std::optional<std::string>& error_message,
                                             std::string_view comment_prefix,
                                             bool& marked) const {
    auto lines = utils::split_lines(body);
    const auto existing_marker = std::format("{} ERROR", comment_prefix);

    marked = false;
    for (auto& line : lines) {
        if (!has_error_indicator(line)) continue;
        if (line.find(existing_marker) != std::string::npos) continue;
        // Appending after a continuation backslash would break the line join
        if (!line.empty() && line.back() == '\\') continue;

        line += std::format("  {} {}", comment_prefix, kErrorMarker);
        marked = true;
        break;
    }

    if (!marked && error_message && !error_message->empty()) {
        lines.emplace_back("");
        lines.push_back(std::format("{} Error: {}...", comment_prefix,
            summarize(*error_message, config_.error_summary_chars)));
        marked = true;
    }
    return utils::join_lines(lines);
}

std::string MRESynthesizer::truncate(const std::string& code, std::string_view comment_prefix) const {
    auto lines = utils::split_lines(code);
    if (lines.size() <= config_.max_lines) {
        return code;
    }
    lines.resize(config_.max_lines);
    lines.push_back(std::format("{} ... (truncated)", comment_prefix));
    return utils::join_lines(lines);
}

MREResult MRESynthesizer::synthesize(const std::string& code,
                                     const std::optional<std::string>& error_message) const {
    MREResult result;
    result.original_code = code;

    if (utils::trim(code).empty()) {
        result.quality_score = 0.0;
        result.syntax_valid = true;
        result.warnings.emplace_back("Empty code provided");
        return result;
    }

    result.language = detect_language(code);
    const auto& analyzer = analyzer_for(result.language);
    const auto prefix = analyzer.comment_prefix();

    auto analysis = analyzer.analyze(code);

    // One abstractor for body and imports: a name maps to the same generic everywhere
    NameAbstractor names;
    names.collect(analysis.body);
    for (const auto& imp : analysis.imports) {
        names.collect(imp);
    }

    for (const auto& imp : analysis.imports) {
        result.imports_kept.push_back(analyzer.filter_import(names.apply(imp)));
    }

    auto body = add_error_marker(names.apply(analysis.body), error_message, prefix,
                                 result.error_marker_added);

    std::string mre;
    if (result.imports_kept.empty()) {
        mre = std::move(body);
    } else {
        mre = utils::join_lines(result.imports_kept) + "\n\n" + body;
    }
    mre = truncate(mre, prefix);

    if (analyzer.has_parser()) {
        if (auto error = analyzer.validate(mre)) {
            result.syntax_valid = false;
            result.warnings.push_back(std::format("Syntax validation failed: {}", *error));
        }
    } else if (result.language == Language::UNKNOWN) {
        result.warnings.emplace_back("Language not detected, limited processing applied");
    } else {
        result.warnings.push_back(std::format(
            "Limited processing for {}: no import filtering or syntax validation",
            language_to_string(result.language)));
    }

    result.names_replaced = names.replacements();
    result.synthesized_mre = std::move(mre);
    result.line_count = utils::split_lines(result.synthesized_mre).size();
    result.quality_score = quality_score(result);

    utils::log::debug(std::format("MRE: language={} lines={} names={} syntax_valid={}",
        language_to_string(result.language), result.line_count,
        result.names_replaced.size(), result.syntax_valid));
    return result;
}

double MRESynthesizer::quality_score(const MREResult& result) {
    double score = 0.0;

    if (result.line_count >= 10 && result.line_count <= 50) {
        score += 0.3;
    } else if (result.line_count < 10) {
        score += 0.2;
    } else {
        score += 0.1;
    }

    if (result.names_replaced.empty()) {
        score += 0.1;
    } else {
        score += std::min(static_cast<double>(result.names_replaced.size()) / 5.0, 1.0) * 0.3;
    }

    score += result.syntax_valid ? 0.2 : 0.1;
    score += utils::contains_ci(result.synthesized_mre, "error") ? 0.2 : 0.1;

    return std::min(score, 1.0);
}

} // namespace sanitizer
