/**
 * @file ApaHtmlParser.cpp
 * @brief Implementation of ApaHtmlParser.
 */

#include "infrastructure/ApaHtmlParser.hpp"
#include "infrastructure/TextUtils.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/uri.h>
#include <libxml/xpath.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstring>
#include <memory>
#include <utility>

namespace finnews::infrastructure {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};
struct XPathContextDeleter {
    void operator()(xmlXPathContext* ctx) const noexcept { xmlXPathFreeContext(ctx); }
};
struct XPathObjectDeleter {
    void operator()(xmlXPathObject* obj) const noexcept { xmlXPathFreeObject(obj); }
};
struct XmlCharDeleter {
    void operator()(xmlChar* s) const noexcept { xmlFree(s); }
};

using DocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using ContextPtr = std::unique_ptr<xmlXPathContext, XPathContextDeleter>;
using XPathResultPtr = std::unique_ptr<xmlXPathObject, XPathObjectDeleter>;
using XmlStringPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

// Matches a whole token of the class attribute, like the CSS ".name" selector.
std::string HasClass(const std::string& name) {
    return "contains(concat(' ', normalize-space(@class), ' '), ' " + name + " ')";
}

const std::string kItemAnchors = "//a[@href][" + HasClass("item") + "]";
const std::string kItemTitle = ".//h2[" + HasClass("title") + "]";
const std::string kItemDate = ".//div[" + HasClass("date") + "]";
const std::string kArticleBodyPrimary =
    "//body/main/div[2]/div[2]/div[2]/div/div[1]/div[1]/div[3]/div[3]";
const std::string kArticleBodyFallback =
    "//div[@itemprop='articleBody'][" + HasClass("texts") + "][" + HasClass("mb-site") + "]";

DocPtr ParseHtml(const std::string& html, const std::string& url) {
    if (html.empty()) return nullptr;
    return DocPtr(htmlReadMemory(html.data(), static_cast<int>(html.size()),
                                 url.empty() ? nullptr : url.c_str(), "UTF-8",
                                 HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                 HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
}

std::vector<xmlNodePtr> Select(xmlXPathContext* ctx, const std::string& expr, xmlNodePtr scope = nullptr) {
    std::vector<xmlNodePtr> nodes;
    XPathResultPtr result(scope
        ? xmlXPathNodeEval(scope, reinterpret_cast<const xmlChar*>(expr.c_str()), ctx)
        : xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(expr.c_str()), ctx));
    if (result && result->nodesetval) {
        for (int i = 0; i < result->nodesetval->nodeNr; ++i) {
            nodes.push_back(result->nodesetval->nodeTab[i]);
        }
    }
    return nodes;
}

xmlNodePtr SelectFirst(xmlXPathContext* ctx, const std::string& expr, xmlNodePtr scope = nullptr) {
    auto nodes = Select(ctx, expr, scope);
    return nodes.empty() ? nullptr : nodes.front();
}

bool IsSkippedElement(xmlNodePtr node) {
    if (node->type != XML_ELEMENT_NODE || !node->name) return false;
    const char* name = reinterpret_cast<const char*>(node->name);
    return std::strcmp(name, "script") == 0 || std::strcmp(name, "style") == 0 ||
           std::strcmp(name, "noscript") == 0;
}

void CollectStrings(xmlNodePtr node, std::vector<std::string>& out) {
    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
            if (child->content) {
                std::string piece = TextUtils::Trim(reinterpret_cast<const char*>(child->content));
                if (!piece.empty()) out.push_back(std::move(piece));
            }
        } else if (child->type == XML_ELEMENT_NODE && !IsSkippedElement(child)) {
            CollectStrings(child, out);
        }
    }
}

// Stripped text fragments of the subtree joined with `separator`.
std::string NodeText(xmlNodePtr node, const std::string& separator = "") {
    if (!node) return {};
    std::vector<std::string> pieces;
    CollectStrings(node, pieces);

    std::string text;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (i > 0) text += separator;
        text += pieces[i];
    }
    return text;
}

std::string ResolveLink(const std::string& href, const std::string& baseUrl) {
    if (href.rfind("http", 0) == 0 || baseUrl.empty()) return href;

    XmlStringPtr resolved(xmlBuildURI(reinterpret_cast<const xmlChar*>(href.c_str()),
                                      reinterpret_cast<const xmlChar*>(baseUrl.c_str())));
    if (!resolved) return href;
    return reinterpret_cast<const char*>(resolved.get());
}

} // namespace

ApaHtmlParser::ApaHtmlParser(ListingRules rules) : m_rules(std::move(rules)) {
    // Must run before documents are parsed from more than one thread
    xmlInitParser();
}

bool ApaHtmlParser::IsExcludedLink(const std::string& link, const std::vector<std::string>& markers) {
    return std::any_of(markers.begin(), markers.end(),
                       [&link](const std::string& marker) {
                           return !marker.empty() && link.find(marker) != std::string::npos;
                       });
}

std::string ApaHtmlParser::CleanTitle(const std::string& title) {
    const size_t tail = TextUtils::Utf8TailOffset(title, 6);
    const bool digitInTail = std::any_of(title.begin() + static_cast<std::ptrdiff_t>(tail), title.end(),
                                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (!digitInTail) return title;
    return TextUtils::RightStrip(title, "0123456789:.- ");
}

std::vector<domain::Article> ApaHtmlParser::extractListing(const std::string& html, const std::string& baseUrl) const {
    std::vector<domain::Article> found;

    DocPtr doc = ParseHtml(html, baseUrl);
    if (!doc) return found;
    ContextPtr ctx(xmlXPathNewContext(doc.get()));
    if (!ctx) return found;

    for (xmlNodePtr anchor : Select(ctx.get(), kItemAnchors)) {
        XmlStringPtr hrefAttr(xmlGetProp(anchor, reinterpret_cast<const xmlChar*>("href")));
        if (!hrefAttr) continue;
        std::string href = TextUtils::Trim(reinterpret_cast<const char*>(hrefAttr.get()));
        if (href.empty()) continue;

        std::string link = ResolveLink(href, baseUrl);
        if (IsExcludedLink(link, m_rules.excludedLinkMarkers)) continue;

        xmlNodePtr titleNode = SelectFirst(ctx.get(), kItemTitle, anchor);
        std::string title = NodeText(titleNode ? titleNode : anchor);
        if (title.empty() || TextUtils::Utf8Length(title) < m_rules.minTitleLength) continue;

        std::string timeText;
        std::string dateText;
        if (xmlNodePtr dateDiv = SelectFirst(ctx.get(), kItemDate, anchor)) {
            auto spans = Select(ctx.get(), ".//span", dateDiv);
            if (spans.size() >= 2) {
                timeText = NodeText(spans[0]);
                dateText = NodeText(spans[1]);
            } else if (spans.size() == 1) {
                dateText = NodeText(spans[0]);
            }
        }

        title = CleanTitle(title);
        if (title.empty()) continue;

        domain::Article article;
        article.title = std::move(title);
        article.link = std::move(link);
        article.displayDate = TextUtils::Trim(timeText + " " + dateText);
        article.source = m_rules.sourceLabel;
        found.push_back(std::move(article));
    }
    return found;
}

std::string ApaHtmlParser::extractBody(const std::string& html) const {
    DocPtr doc = ParseHtml(html, "");
    if (!doc) return {};
    ContextPtr ctx(xmlXPathNewContext(doc.get()));
    if (!ctx) return {};

    xmlNodePtr node = SelectFirst(ctx.get(), kArticleBodyPrimary);
    if (!node) node = SelectFirst(ctx.get(), kArticleBodyFallback);
    if (!node) node = xmlDocGetRootElement(doc.get());
    return NodeText(node, "\n\n");
}

} // namespace finnews::infrastructure
