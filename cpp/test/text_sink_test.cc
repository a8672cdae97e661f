#include "TextSink.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace dissolve;

static QualName html(const char* local) {
    return QualName(Namespace::Html, local);
}

// ============================================================================
// Node creation
// ============================================================================

TEST(TextSink, DocumentIsFreshEachTime) {
    TextSink sink;
    NodePtr first = sink.getDocument();
    NodePtr second = sink.getDocument();
    EXPECT_EQ(first->type(), NodeType::Document);
    EXPECT_FALSE(sink.sameNode(first, second));
}

TEST(TextSink, CreateElementKeepsOnlyTheName) {
    TextSink sink;
    AttribList attrs;
    Attribute id;
    id.name = QualName(Namespace::None, "id");
    id.value = "main";
    attrs.push_back(id);

    NodePtr div = sink.createElement(html("div"), attrs, ElementFlags());
    EXPECT_EQ(sink.elemName(div), html("div"));
}

TEST(TextSink, CommentsAndProcessingInstructionsCarryNoText) {
    TextSink sink;
    NodePtr doc = sink.getDocument();
    NodePtr comment = sink.createComment("hidden");
    NodePtr pi = sink.createPI("xml-stylesheet", "href=a.css");

    EXPECT_EQ(comment->type(), NodeType::Comment);
    EXPECT_EQ(pi->type(), NodeType::ProcessingInstruction);

    sink.append(doc, NodeOrText(comment));
    sink.append(doc, NodeOrText(pi));
    EXPECT_EQ(sink.finish(), "");
}

TEST(TextSink, ElemNameOfNonElementThrows) {
    TextSink sink;
    EXPECT_THROW(sink.elemName(sink.getDocument()), ContractViolation);
    EXPECT_THROW(sink.elemName(sink.createComment("c")), ContractViolation);
    EXPECT_THROW(sink.elemName(NodePtr()), ContractViolation);
}

// ============================================================================
// Text accumulation
// ============================================================================

TEST(TextSink, AppendKeepsEmissionOrder) {
    TextSink sink;
    NodePtr doc = sink.getDocument();
    NodePtr body = sink.createElement(html("body"), AttribList(), ElementFlags());
    NodePtr div = sink.createElement(html("div"), AttribList(), ElementFlags());

    sink.append(doc, NodeOrText(body));
    sink.append(body, NodeOrText(string("Hello")));
    sink.append(body, NodeOrText(div));
    sink.append(div, NodeOrText(string("World!")));

    EXPECT_EQ(sink.finish(), "HelloWorld!");
}

TEST(TextSink, FosterParentedTextStaysInPlace) {
    TextSink sink;
    NodePtr body = sink.createElement(html("body"), AttribList(), ElementFlags());
    NodePtr table = sink.createElement(html("table"), AttribList(), ElementFlags());
    NodePtr td = sink.createElement(html("td"), AttribList(), ElementFlags());

    sink.append(body, NodeOrText(string("a")));
    sink.appendBasedOnParentNode(table, body, NodeOrText(string(" b")));
    sink.append(td, NodeOrText(string(" c")));
    sink.appendBasedOnParentNode(table, body, NodeOrText(table));
    sink.appendBasedOnParentNode(table, body, NodeOrText(string(" d")));

    EXPECT_EQ(sink.finish(), "a b c d");
}

TEST(TextSink, TemplateContentsAreAFreshDocument) {
    TextSink sink;
    ElementFlags flags;
    flags.isTemplate = true;
    NodePtr body = sink.createElement(html("body"), AttribList(), ElementFlags());
    NodePtr tmpl = sink.createElement(html("template"), AttribList(), flags);

    NodePtr contents = sink.getTemplateContents(tmpl);
    EXPECT_EQ(contents->type(), NodeType::Document);
    EXPECT_FALSE(sink.sameNode(contents, sink.getTemplateContents(tmpl)));

    sink.append(body, NodeOrText(string("aaa ")));
    sink.append(contents, NodeOrText(string("bbb ")));
    sink.append(body, NodeOrText(string("ccc")));
    EXPECT_EQ(sink.finish(), "aaa bbb ccc");
}

TEST(TextSink, StructuralCallbacksHaveNoEffect) {
    TextSink sink;
    NodePtr doc = sink.getDocument();
    NodePtr p = sink.createElement(html("p"), AttribList(), ElementFlags());
    NodePtr b = sink.createElement(html("b"), AttribList(), ElementFlags());

    sink.append(p, NodeOrText(string("one ")));
    sink.appendDoctypeToDocument("html", "", "");
    sink.setQuirksMode(QuirksMode::Quirks);
    sink.addAttributesIfMissing(p, AttribList());
    sink.reparentChildren(p, b);
    sink.removeFromParent(p);
    sink.append(b, NodeOrText(string("two")));

    EXPECT_EQ(sink.finish(), "one two");
}

TEST(TextSink, ParseErrorsAreLoggedNotRaised) {
    std::ostringstream out;
    TextSink sink(Log(LogLevel::Debug, &out));

    sink.parseError("unexpected end tag");
    EXPECT_NE(out.str().find("unexpected end tag"), string::npos);
    EXPECT_EQ(sink.finish(), "");
}

TEST(TextSink, SameNodeIsReferenceIdentity) {
    TextSink sink;
    NodePtr a = sink.createElement(html("a"), AttribList(), ElementFlags());
    NodePtr b = sink.createElement(html("a"), AttribList(), ElementFlags());
    EXPECT_TRUE(sink.sameNode(a, a));
    EXPECT_FALSE(sink.sameNode(a, b));
}

// ============================================================================
// Contract violations
// ============================================================================

TEST(TextSink, AppendBeforeSiblingIsRejected) {
    TextSink sink;
    NodePtr sibling = sink.createElement(html("table"), AttribList(), ElementFlags());
    EXPECT_THROW(sink.appendBeforeSibling(sibling, NodeOrText(string("x"))), ContractViolation);
    EXPECT_THROW(sink.appendBeforeSibling(sibling, NodeOrText(sibling)), ContractViolation);
}

TEST(TextSink, FinishHandsOverOnce) {
    TextSink sink;
    NodePtr body = sink.createElement(html("body"), AttribList(), ElementFlags());
    sink.append(body, NodeOrText(string("done")));

    EXPECT_FALSE(sink.finished());
    EXPECT_EQ(sink.finish(), "done");
    EXPECT_TRUE(sink.finished());

    EXPECT_THROW(sink.finish(), ContractViolation);
    EXPECT_THROW(sink.append(body, NodeOrText(string("late"))), ContractViolation);
    EXPECT_THROW(sink.getDocument(), ContractViolation);
}

TEST(TextSink, QueriesAreRejectedAfterFinish) {
    TextSink sink;
    NodePtr body = sink.createElement(html("body"), AttribList(), ElementFlags());
    NodePtr table = sink.createElement(html("table"), AttribList(), ElementFlags());
    EXPECT_EQ(sink.finish(), "");

    EXPECT_THROW(sink.elemName(body), ContractViolation);
    EXPECT_THROW(sink.sameNode(body, table), ContractViolation);
    EXPECT_THROW(sink.sameNode(body, body), ContractViolation);
}
