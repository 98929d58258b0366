#include "splitsheet/reader/TagScopedVisitor.hpp"

namespace splitsheet {
namespace reader {

std::vector<std::string> TagScopedVisitor::splitScope(std::string_view scope) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= scope.size()) {
        size_t next = scope.find('/', pos);
        if (next == std::string_view::npos) next = scope.size();
        if (next > pos) {
            segments.emplace_back(scope.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

bool TagScopedVisitor::matches(const std::vector<std::string>& scope, const std::vector<std::string>& stack) {
    if (scope.empty() || stack.empty() || scope.back() != stack.back()) {
        return false;
    }
    // 祖先段从内向外匹配
    size_t s = scope.size() - 1;
    size_t k = stack.size() - 1;
    while (s > 0) {
        if (k == 0) {
            return false;
        }
        --k;
        if (stack[k] == scope[s - 1]) {
            --s;
        }
    }
    return true;
}

TagScopedVisitor& TagScopedVisitor::onElement(std::string_view scope, ElementHandler handler) {
    rules_.push_back(Rule{RuleKind::Element, splitScope(scope), {}, std::move(handler), {}, {}});
    return *this;
}

TagScopedVisitor& TagScopedVisitor::onAttribute(std::string_view scope, std::string_view attribute,
                                                ValueHandler handler) {
    rules_.push_back(Rule{RuleKind::Attribute, splitScope(scope), std::string(attribute), {}, std::move(handler), {}});
    return *this;
}

TagScopedVisitor& TagScopedVisitor::onText(std::string_view scope, ValueHandler handler) {
    rules_.push_back(Rule{RuleKind::Text, splitScope(scope), {}, {}, std::move(handler), {}});
    return *this;
}

TagScopedVisitor& TagScopedVisitor::onLeave(std::string_view scope, LeaveHandler handler) {
    rules_.push_back(Rule{RuleKind::Leave, splitScope(scope), {}, {}, {}, std::move(handler)});
    return *this;
}

TagScopedVisitor& TagScopedVisitor::preserveWhitespace(bool preserve) {
    trim_whitespace_ = !preserve;
    return *this;
}

void TagScopedVisitor::visit(std::string_view xml_content, const std::string& part_name) {
    READER_DEBUG("Visiting part {} ({} bytes, {} rules)", part_name, xml_content.size(), rules_.size());
    parseOrThrow(xml_content, part_name);
}

void TagScopedVisitor::onStartElement(std::string_view /*name*/, const Attributes& attributes, int /*depth*/) {
    const auto& stack = elementStack();
    for (const auto& rule : rules_) {
        if (rule.kind == RuleKind::Element) {
            if (matches(rule.scope, stack)) {
                rule.element_handler(attributes);
            }
        } else if (rule.kind == RuleKind::Attribute) {
            if (matches(rule.scope, stack)) {
                if (auto value = findAttribute(attributes, rule.attribute)) {
                    rule.value_handler(*value);
                }
            }
        }
    }
}

void TagScopedVisitor::onEndElement(std::string_view /*name*/, int /*depth*/) {
    const auto& stack = elementStack();
    for (const auto& rule : rules_) {
        if (rule.kind == RuleKind::Leave && matches(rule.scope, stack)) {
            rule.leave_handler();
        }
    }
}

void TagScopedVisitor::onText(std::string_view text, int /*depth*/) {
    const auto& stack = elementStack();
    for (const auto& rule : rules_) {
        if (rule.kind == RuleKind::Text && matches(rule.scope, stack)) {
            rule.value_handler(text);
        }
    }
}

}} // namespace splitsheet::reader
