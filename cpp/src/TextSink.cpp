#include "TextSink.hpp"
#include "Errors.hpp"

namespace dissolve
{

TextSink::TextSink(const Log& log)
    : log(log)
    , done(false)
{}

NodePtr TextSink::getDocument()
{
    checkOpen("getDocument");
    return Node::create(NodeType::Document);
}

const QualName& TextSink::elemName(const NodePtr& target) const
{
    checkOpen("elemName");
    if (!target) {
        throw ContractViolation("elemName called without a node");
    }
    return target->qualifiedName();
}

NodePtr TextSink::createElement(const QualName& name,
                                const AttribList& attrs,
                                ElementFlags flags)
{
    checkOpen("createElement");
    return Node::createElement(name);
}

NodePtr TextSink::createComment(const string& text)
{
    checkOpen("createComment");
    return Node::create(NodeType::Comment);
}

NodePtr TextSink::createPI(const string& target, const string& data)
{
    checkOpen("createPI");
    return Node::create(NodeType::ProcessingInstruction);
}

void TextSink::appendDoctypeToDocument(const string& name,
                                       const string& publicId,
                                       const string& systemId)
{
    checkOpen("appendDoctypeToDocument");
}

void TextSink::append(const NodePtr& parent, const NodeOrText& child)
{
    checkOpen("append");
    pushText(child);
}

void TextSink::appendBasedOnParentNode(const NodePtr& element,
                                       const NodePtr& prevElement,
                                       const NodeOrText& child)
{
    checkOpen("appendBasedOnParentNode");
    pushText(child);
}

void TextSink::appendBeforeSibling(const NodePtr& sibling,
                                   const NodeOrText& newNode)
{
    // Inserting before a sibling would put this text ahead of text that
    // was already flushed to the buffer. There is no way to honour that.
    throw ContractViolation("appendBeforeSibling is not supported by the text sink");
}

NodePtr TextSink::getTemplateContents(const NodePtr& target)
{
    checkOpen("getTemplateContents");
    return Node::create(NodeType::Document);
}

bool TextSink::sameNode(const NodePtr& x, const NodePtr& y) const
{
    checkOpen("sameNode");
    return dissolve::sameNode(x, y);
}

void TextSink::setQuirksMode(QuirksMode mode)
{
    checkOpen("setQuirksMode");
}

void TextSink::addAttributesIfMissing(const NodePtr& target,
                                      const AttribList& attrs)
{
    checkOpen("addAttributesIfMissing");
}

void TextSink::removeFromParent(const NodePtr& target)
{
    checkOpen("removeFromParent");
}

// Text was flushed when it was first inserted; moving it now changes nothing
void TextSink::reparentChildren(const NodePtr& node, const NodePtr& newParent)
{
    checkOpen("reparentChildren");
}

void TextSink::parseError(const string& message)
{
    log.at(LogLevel::Debug) << "parse error: " << message;
}

string TextSink::finish()
{
    checkOpen("finish");
    done = true;
    string result;
    result.swap(text);
    return result;
}

void TextSink::pushText(const NodeOrText& child)
{
    if (const string* chunk = boost::get<string>(&child)) {
        text += *chunk;
    }
}

void TextSink::checkOpen(const char* operation) const
{
    if (done) {
        throw ContractViolation(string(operation) + " called on a finished TextSink");
    }
}

} // namespace dissolve
