#ifndef __HAVE_TEXTSINK__
#define __HAVE_TEXTSINK__

#include "TreeSink.hpp"
#include "Log.hpp"

namespace dissolve
{

/**
 * A TreeSink that keeps nothing but character data.
 *
 * Every text payload, whichever parent it is nominally inserted under
 * (main tree, foster parent, template contents), is appended to a single
 * buffer in the order the tree builder emits it. Structural callbacks are
 * accepted and dropped.
 */
class TextSink
    : public TreeSink
{
public:
    explicit TextSink(const Log& log = Log());

    virtual NodePtr getDocument();
    virtual const QualName& elemName(const NodePtr& target) const;

    virtual NodePtr createElement(const QualName& name,
                                  const AttribList& attrs,
                                  ElementFlags flags);
    virtual NodePtr createComment(const string& text);
    virtual NodePtr createPI(const string& target, const string& data);

    virtual void appendDoctypeToDocument(const string& name,
                                         const string& publicId,
                                         const string& systemId);
    virtual void append(const NodePtr& parent, const NodeOrText& child);
    virtual void appendBasedOnParentNode(const NodePtr& element,
                                         const NodePtr& prevElement,
                                         const NodeOrText& child);
    virtual void appendBeforeSibling(const NodePtr& sibling,
                                     const NodeOrText& newNode);

    virtual NodePtr getTemplateContents(const NodePtr& target);
    virtual bool sameNode(const NodePtr& x, const NodePtr& y) const;

    virtual void setQuirksMode(QuirksMode mode);
    virtual void addAttributesIfMissing(const NodePtr& target,
                                        const AttribList& attrs);
    virtual void removeFromParent(const NodePtr& target);
    virtual void reparentChildren(const NodePtr& node,
                                  const NodePtr& newParent);
    virtual void parseError(const string& message);

    /**
     * Hand over the collected text. Can be called once; any later callback
     * throws ContractViolation.
     */
    string finish();

    bool finished() const {
        return done;
    }

private:
    void pushText(const NodeOrText& child);
    void checkOpen(const char* operation) const;

    Log log;
    string text;
    bool done;
};

} // namespace dissolve

#endif
