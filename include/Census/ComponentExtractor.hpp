// =================================================================
// include/Census/ComponentExtractor.hpp
// =================================================================
// Heuristic extraction of component declaration names from source text.

#pragma once

#include "FilterTables.hpp"
#include <functional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace Census {

/**
 * @brief One structural rule recognizing a single declaration shape
 *
 * A rule is a regular expression for the fixed-length head of the shape,
 * whose first capture group is the declaration name, plus an optional
 * tail matcher. Spans of unbounded length (parameter lists, type
 * annotations) are left to the tail matcher, which walks them with plain
 * string scans, so the regex engine only ever sees short matches.
 */
class PatternRule {
public:
    /**
     * @brief Checks the rest of a shape after the head matched
     *
     * Receives the text and the offset just past the head. Returns the
     * offset just past the complete shape, or std::string::npos if the
     * shape is not completed.
     */
    using TailMatcher = std::function<size_t(const std::string&, size_t)>;

    /**
     * @brief Compile a rule
     * @param name Short identifier of the shape, e.g. "class-declaration"
     * @param head ECMAScript regular expression with one capture group
     * @param tail Matcher for the remainder, or nullptr if the head is the whole shape
     * @throws std::regex_error if the expression does not compile
     */
    PatternRule(const std::string& name, const std::string& head, TailMatcher tail = nullptr);

    const std::string& getName() const { return m_name; }

    /**
     * @brief Collect the captured name of every non-overlapping match
     * @param text Source text to search
     * @return Names in match order, unfiltered and possibly repeated
     */
    std::vector<std::string> findNames(const std::string& text) const;

private:
    std::string m_name;
    std::regex m_head;
    TailMatcher m_tail;
};

/**
 * @brief Extracts component-like declaration names from one file's text
 *
 * A cheap pre-check screens out text without any framework indicator and
 * without a markup-returning statement. Remaining text is run through
 * every rule; each captured name longer than one character and not on the
 * rejected-name list is kept. The result is a set, so a name matched by
 * several rules appears once.
 *
 * extract() never throws for any input text. Instances are immutable after
 * construction and safe to share between threads.
 */
class ComponentExtractor {
public:
    /**
     * @brief Construct an extractor with the built-in rule list
     * @param filters Tables supplying the rejected-name list
     */
    explicit ComponentExtractor(const FilterTables& filters = FilterTables::defaults());

    /**
     * @brief Extract declaration names from source text
     * @param text Full contents of one file
     * @return Set of accepted names, empty if nothing matched
     */
    std::set<std::string> extract(const std::string& text) const;

    /**
     * @brief Run the rules and name filters without the pre-check
     * @param text Source text
     * @return Set of accepted names
     */
    std::set<std::string> applyRules(const std::string& text) const;

    /**
     * @brief Check if text is worth running the rules against
     * @param text Source text
     * @return true if any framework indicator or a markup return is present
     */
    bool passesPreCheck(const std::string& text) const;

    /**
     * @brief Check a captured name against the length and denylist filters
     */
    bool acceptsName(const std::string& name) const;

    const std::vector<PatternRule>& rules() const { return m_rules; }

    /**
     * @brief Substrings whose presence lets text through the pre-check
     */
    static const std::vector<std::string>& frameworkIndicators();

private:
    const FilterTables& m_filters;
    std::vector<PatternRule> m_rules;
    std::regex m_markup_return;

    static std::vector<PatternRule> buildDefaultRules();
};

} // namespace Census
