#pragma once

#include "splitsheet/reader/BaseSAXParser.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace splitsheet {
namespace reader {

/**
 * @brief 按规则驱动的流式 XML 访问器
 *
 * 规则由作用域路径描述，例如 "twoCellAnchor/from/row"：
 * 最后一段必须是当前元素的本地名，前面各段必须按顺序出现在祖先链上（不要求直接相邻）。
 * 一个部件只需要声明"关心哪个标签的哪个属性/文本，在哪个标签结束时提交"，
 * 不再为每个部件手写状态机。
 *
 * @code
 * TagScopedVisitor visitor;
 * visitor.onAttribute("cellImage/cNvPr", "name", [&](std::string_view v) { id = v; })
 *        .onAttribute("cellImage/blip", "embed", [&](std::string_view v) { rid = v; })
 *        .onLeave("cellImage", [&] { commit(); });
 * visitor.visit(xml, "xl/cellimages.xml");
 * @endcode
 */
class TagScopedVisitor : public BaseSAXParser {
public:
    using Attributes = BaseSAXParser::Attributes;
    using ElementHandler = std::function<void(const Attributes& attributes)>;
    using ValueHandler = std::function<void(std::string_view value)>;
    using LeaveHandler = std::function<void()>;

    TagScopedVisitor() = default;

    /**
     * @brief 进入匹配元素时回调（拿到全部属性）
     */
    TagScopedVisitor& onElement(std::string_view scope, ElementHandler handler);

    /**
     * @brief 进入匹配元素且带有指定属性（按本地名）时回调属性值
     */
    TagScopedVisitor& onAttribute(std::string_view scope, std::string_view attribute, ValueHandler handler);

    /**
     * @brief 匹配元素的文本内容（在结束标签前交付）
     */
    TagScopedVisitor& onText(std::string_view scope, ValueHandler handler);

    /**
     * @brief 离开匹配元素时回调
     */
    TagScopedVisitor& onLeave(std::string_view scope, LeaveHandler handler);

    /**
     * @brief 保留文本首尾空白（共享字符串等）
     */
    TagScopedVisitor& preserveWhitespace(bool preserve = true);

    /**
     * @brief 访问整个部件
     * @throws core::ParseException XML 格式错误
     */
    void visit(std::string_view xml_content, const std::string& part_name);

    /**
     * @brief 作用域是否与元素栈匹配
     */
    static bool matches(const std::vector<std::string>& scope, const std::vector<std::string>& stack);

private:
    enum class RuleKind { Element, Attribute, Text, Leave };

    struct Rule {
        RuleKind kind;
        std::vector<std::string> scope;
        std::string attribute;
        ElementHandler element_handler;
        ValueHandler value_handler;
        LeaveHandler leave_handler;
    };

    std::vector<Rule> rules_;

    static std::vector<std::string> splitScope(std::string_view scope);

protected:
    void onStartElement(std::string_view name, const Attributes& attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
    void onText(std::string_view text, int depth) override;
};

}} // namespace splitsheet::reader
