#ifndef __HAVE_NODE__
#define __HAVE_NODE__

#include <ostream>
#include "LibIncludes.hpp"
#include "IntrusivePtrBase.hpp"

namespace dissolve
{
    /**
     * Reference counted construction-time handles
     *
     * The tree builder keeps the whole document topology to itself. What it
     * needs from us is something to point at: a value with a stable
     * identity, the qualified name of elements, and the payload of text
     * nodes. Nodes therefore carry no parent, child or sibling links.
     */

    // Node type identifiers for dynamic type checking
    enum class NodeType {
        Document,
        Doctype,
        Comment,
        ProcessingInstruction,
        Element,
        Text,
    };

    enum class Namespace {
        None,
        Html,
        MathML,
        Svg,
        XLink,
        Xml,
        XmlNs,
    };

    struct QualName
    {
        QualName()
            : ns(Namespace::None) {}
        QualName(Namespace ns, const string& local)
            : ns(ns)
            , local(local) {}

        bool operator==(const QualName& r) const {
            return ns == r.ns && local == r.local;
        }
        bool operator!=(const QualName& r) const {
            return !(*this == r);
        }

        Namespace ns;
        string local;
    };

    std::ostream& operator<<(std::ostream& os, const QualName& name);

    struct Attribute
    {
        QualName name;
        string value;
    };
    typedef vector<Attribute> AttribList;

    class Node;
    typedef boost::intrusive_ptr<Node> NodePtr;

    class Node: public IntrusivePtrBase< Node >
    {
        public:
            // Handles without payload: Document, Doctype, Comment and
            // ProcessingInstruction
            static NodePtr create( NodeType type );
            static NodePtr createElement( const QualName& name );
            static NodePtr createText( const string& text );

            NodeType type() const {
                return nodeType;
            }
            bool isElement() const {
                return nodeType == NodeType::Element;
            }
            bool isText() const {
                return nodeType == NodeType::Text;
            }

            // Throws ContractViolation unless this is an Element
            const QualName& qualifiedName() const;
            // Throws ContractViolation unless this is a Text node
            const string& text() const;

            // Shallow copy with a new identity
            NodePtr clone() const;

            static const char* typeName( NodeType type );

        private:
            Node( NodeType type, const QualName& name, const string& payload );

            NodeType nodeType;
            QualName name;
            string payload;
    };

    // Handles are the same node iff they share the allocation
    inline bool sameNode( const NodePtr& x, const NodePtr& y ) {
        return x.get() == y.get();
    }

} // namespace dissolve

#endif
