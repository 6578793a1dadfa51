// =================================================================
// src/Census/ComponentExtractor.cpp
// =================================================================
// Implementation of the pattern-rule declaration extractor.

#include "Census/ComponentExtractor.hpp"
#include "Census/Logger.hpp"
#include <cctype>

namespace Census {

namespace {

const size_t NO_MATCH = std::string::npos;

size_t skipSpace(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

bool consume(const std::string& text, size_t& pos, const std::string& literal) {
    if (text.compare(pos, literal.size(), literal) == 0) {
        pos += literal.size();
        return true;
    }
    return false;
}

bool consumeAny(const std::string& text, size_t& pos, const std::vector<std::string>& literals) {
    for (const auto& literal : literals) {
        if (consume(text, pos, literal)) {
            return true;
        }
    }
    return false;
}

// ": [React.]<one of types>", with pos on the colon
bool consumeTypeAnnotation(const std::string& text, size_t& pos, const std::vector<std::string>& types) {
    size_t cursor = pos;
    if (!consume(text, cursor, ":")) {
        return false;
    }
    cursor = skipSpace(text, cursor);
    consume(text, cursor, "React.");
    if (!consumeAny(text, cursor, types)) {
        return false;
    }
    pos = cursor;
    return true;
}

// Offset just past the first ')' at or after pos
size_t skipParameterList(const std::string& text, size_t pos) {
    size_t close = text.find(')', pos);
    return close == std::string::npos ? NO_MATCH : close + 1;
}

const std::vector<std::string>& elementTypes() {
    static const std::vector<std::string> types = {"ReactElement", "ReactNode", "JSX.Element"};
    return types;
}

const std::vector<std::string>& componentTypes() {
    static const std::vector<std::string> types = {"FC", "FunctionComponent"};
    return types;
}

// After "function Name(": ") [: ElementType ...] {"
size_t matchFunctionTail(const std::string& text, size_t pos) {
    pos = skipParameterList(text, pos);
    if (pos == NO_MATCH) {
        return NO_MATCH;
    }

    pos = skipSpace(text, pos);
    if (consume(text, pos, "{")) {
        return pos;
    }

    static const std::vector<std::string> types = {
        "ReactElement", "ReactNode", "JSX.Element", "FC", "FunctionComponent"
    };
    if (!consumeTypeAnnotation(text, pos, types)) {
        return NO_MATCH;
    }

    size_t brace = text.find('{', pos);
    return brace == std::string::npos ? NO_MATCH : brace + 1;
}

// After "const Name": "[: FC...] = [React.memo(][React.forwardRef(](...) [: Type...] =>"
size_t matchArrowTail(const std::string& text, size_t pos, bool any_return_type) {
    pos = skipSpace(text, pos);

    if (consumeTypeAnnotation(text, pos, componentTypes())) {
        pos = text.find('=', pos);
        if (pos == std::string::npos) {
            return NO_MATCH;
        }
    }
    if (!consume(text, pos, "=")) {
        return NO_MATCH;
    }

    pos = skipSpace(text, pos);
    if (consume(text, pos, "React.memo")) {
        pos = skipSpace(text, pos);
        if (!consume(text, pos, "(")) {
            return NO_MATCH;
        }
        pos = skipSpace(text, pos);
    }
    if (consume(text, pos, "React.forwardRef")) {
        pos = skipSpace(text, pos);
        if (!consume(text, pos, "(")) {
            return NO_MATCH;
        }
        pos = skipSpace(text, pos);
    }
    if (!consume(text, pos, "(")) {
        return NO_MATCH;
    }

    pos = skipParameterList(text, pos);
    if (pos == NO_MATCH) {
        return NO_MATCH;
    }

    pos = skipSpace(text, pos);
    if (text.compare(pos, 1, ":") == 0) {
        // The annotation runs up to the arrow
        if (any_return_type || consumeTypeAnnotation(text, pos, elementTypes())) {
            pos = text.find('=', pos);
            if (pos == std::string::npos) {
                return NO_MATCH;
            }
        }
    }

    return consume(text, pos, "=>") ? pos : NO_MATCH;
}

} // namespace

// PatternRule implementation

PatternRule::PatternRule(const std::string& name, const std::string& head, TailMatcher tail)
    : m_name(name),
      m_head(head, std::regex_constants::ECMAScript),
      m_tail(std::move(tail))
{
}

std::vector<std::string> PatternRule::findNames(const std::string& text) const {
    std::vector<std::string> names;
    size_t offset = 0;

    try {
        std::smatch match;
        while (offset < text.size()) {
            auto flags = offset > 0 ? std::regex_constants::match_prev_avail
                                    : std::regex_constants::match_default;
            if (!std::regex_search(text.cbegin() + offset, text.cend(), match, m_head, flags)) {
                break;
            }

            size_t start = offset + static_cast<size_t>(match.position(0));
            size_t end = start + static_cast<size_t>(match.length(0));

            if (m_tail) {
                end = m_tail(text, end);
                if (end == NO_MATCH) {
                    // Shape not completed here, retry from the next character
                    offset = start + 1;
                    continue;
                }
            }

            if (match.size() > 1 && match[1].matched) {
                names.push_back(match[1].str());
            }
            offset = end > start ? end : start + 1;
        }
    } catch (const std::regex_error& e) {
        // Keep the names found so far
        LOG_WARNING("ComponentExtractor", "Rule " + m_name + " aborted: " + e.what());
    }

    return names;
}

// ComponentExtractor implementation

ComponentExtractor::ComponentExtractor(const FilterTables& filters)
    : m_filters(filters),
      m_rules(buildDefaultRules()),
      m_markup_return(R"(return\s*<)", std::regex_constants::ECMAScript)
{
}

std::set<std::string> ComponentExtractor::extract(const std::string& text) const {
    if (!passesPreCheck(text)) {
        return {};
    }
    return applyRules(text);
}

std::set<std::string> ComponentExtractor::applyRules(const std::string& text) const {
    std::set<std::string> names;

    for (const auto& rule : m_rules) {
        for (const auto& name : rule.findNames(text)) {
            if (acceptsName(name)) {
                names.insert(name);
            }
        }
    }

    return names;
}

bool ComponentExtractor::passesPreCheck(const std::string& text) const {
    for (const auto& indicator : frameworkIndicators()) {
        if (text.find(indicator) != std::string::npos) {
            return true;
        }
    }
    return std::regex_search(text, m_markup_return);
}

bool ComponentExtractor::acceptsName(const std::string& name) const {
    return name.length() > 1 && !m_filters.isRejectedName(name);
}

const std::vector<std::string>& ComponentExtractor::frameworkIndicators() {
    static const std::vector<std::string> indicators = {
        "React", "jsx", "tsx", "return (", "return("
    };
    return indicators;
}

std::vector<PatternRule> ComponentExtractor::buildDefaultRules() {
    std::vector<PatternRule> rules;

    // function Name(...) [: ReactElement | JSX.Element | ...] {
    rules.emplace_back("function-declaration",
        R"(function\s+([A-Z][a-zA-Z0-9]*)\s*\()",
        matchFunctionTail);

    // const Name[: FC<...>] = [React.memo(][React.forwardRef(](...) [: ReactNode...] =>
    rules.emplace_back("arrow-binding",
        R"((?:const|let|var)\s+([A-Z][a-zA-Z0-9]*))",
        [](const std::string& text, size_t pos) { return matchArrowTail(text, pos, false); });

    rules.emplace_back("class-declaration",
        R"(class\s+([A-Z][a-zA-Z0-9]*)\s+extends\s+(?:React\.)?(?:Component|PureComponent))");

    rules.emplace_back("default-export-function",
        R"(export\s+default\s+function\s+([A-Z][a-zA-Z0-9]*))");

    // Same shape as arrow-binding, with any return annotation
    rules.emplace_back("exported-arrow-binding",
        R"(export\s+(?:const|let|var)\s+([A-Z][a-zA-Z0-9]*))",
        [](const std::string& text, size_t pos) { return matchArrowTail(text, pos, true); });

    rules.emplace_back("exported-function",
        R"(export\s+function\s+([A-Z][a-zA-Z0-9]*)\s*\()");

    return rules;
}

} // namespace Census
