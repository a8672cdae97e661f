#ifndef __HAVE_TREESINK__
#define __HAVE_TREESINK__

#include "LibIncludes.hpp"
#include "Node.hpp"

namespace dissolve
{

enum class QuirksMode {
    NoQuirks,
    LimitedQuirks,
    Quirks,
};

struct ElementFlags
{
    ElementFlags()
        : isTemplate(false)
        , selfClosing(false) {}

    // An HTML <template>; its contents get their own document
    bool isTemplate;
    bool selfClosing;
};

// What gets inserted: an existing node, or a run of character data
typedef boost::variant<NodePtr, string> NodeOrText;

/**
 * The consumer side of HTML5 tree construction.
 *
 * The tree builder owns the insertion-mode state machine and the stack of
 * open elements, and reports every structural decision through these
 * calls. A sink decides what, if anything, to materialize.
 */
class TreeSink
{
public:
    virtual ~TreeSink() {}

    // The root handle; requested once per parse
    virtual NodePtr getDocument() = 0;

    virtual const QualName& elemName(const NodePtr& target) const = 0;

    virtual NodePtr createElement(const QualName& name,
                                  const AttribList& attrs,
                                  ElementFlags flags) = 0;
    virtual NodePtr createComment(const string& text) = 0;
    virtual NodePtr createPI(const string& target, const string& data) = 0;

    virtual void appendDoctypeToDocument(const string& name,
                                         const string& publicId,
                                         const string& systemId) = 0;

    virtual void append(const NodePtr& parent, const NodeOrText& child) = 0;

    // Foster parenting: insert next to a table `element`, or under
    // `prevElement` when the table has no parent
    virtual void appendBasedOnParentNode(const NodePtr& element,
                                         const NodePtr& prevElement,
                                         const NodeOrText& child) = 0;

    virtual void appendBeforeSibling(const NodePtr& sibling,
                                     const NodeOrText& newNode) = 0;

    virtual NodePtr getTemplateContents(const NodePtr& target) = 0;

    virtual bool sameNode(const NodePtr& x, const NodePtr& y) const = 0;

    virtual void setQuirksMode(QuirksMode mode) = 0;

    virtual void addAttributesIfMissing(const NodePtr& target,
                                        const AttribList& attrs) = 0;

    virtual void removeFromParent(const NodePtr& target) = 0;

    virtual void reparentChildren(const NodePtr& node,
                                  const NodePtr& newParent) = 0;

    // Recoverable markup error; the tree builder has already recovered
    virtual void parseError(const string& message) = 0;
};

} // namespace dissolve

#endif
